#include "quickfilter/output_buffer.hpp"
#include "quickfilter/filter_errors.hpp"

#include <plog/Log.h>

#include <string>

namespace quickfilter {

OutputBuffer OutputBuffer::Prepare(std::optional<ArrayView<double>> output, size_t required_length) {
    if (output) {
        if (output->size() != required_length) {
            PLOG_WARNING << "Output length " << output->size() << " does not match required length " << required_length;
            throw OutputLengthMismatchError("Given output array is the wrong length: expected " +
                                            std::to_string(required_length) + ", got " +
                                            std::to_string(output->size()));
        }
        return OutputBuffer(*output);
    }
    return OutputBuffer(required_length);
}

OutputBuffer::OutputBuffer(ArrayView<double> external)
    : view_(external),
      owns_storage_(false) {}

OutputBuffer::OutputBuffer(size_t length)
    : storage_(length, 0.0),
      view_(storage_.data(), storage_.size()),
      owns_storage_(true) {}

OutputBuffer::~OutputBuffer() = default;

std::vector<double> OutputBuffer::Release() {
    std::vector<double> content;
    if (owns_storage_) {
        content = std::move(storage_);
    } else {
        content.assign(view_.begin(), view_.end());
    }
    view_.Reset();
    return content;
}

} // namespace quickfilter
