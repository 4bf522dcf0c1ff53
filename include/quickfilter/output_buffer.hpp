#ifndef _QUICKFILTER_OUTPUT_BUFFER_H_
#define _QUICKFILTER_OUTPUT_BUFFER_H_

#include "base/defines.hpp"
#include "common/array_view.hpp"

#include <optional>
#include <vector>

namespace quickfilter {

// Destination of a filter pass: either a caller supplied buffer or
// freshly allocated zero-initialized storage.
class QUICKFILTER_CPP_EXPORT OutputBuffer {
public:
    // Uses `output` if given, which must be exactly `required_length`
    // long, otherwise allocates. Throws OutputLengthMismatchError.
    static OutputBuffer Prepare(std::optional<ArrayView<double>> output, size_t required_length);

    OutputBuffer(OutputBuffer&&) = default;
    OutputBuffer& operator=(OutputBuffer&&) = default;
    ~OutputBuffer();

    double& operator[](size_t i) { return view_[i]; }
    double operator[](size_t i) const { return view_[i]; }
    size_t size() const { return view_.size(); }
    ArrayView<double> view() const { return view_; }

    // Whether the storage was allocated here rather than by the caller.
    bool owns_storage() const { return owns_storage_; }

    // Returns the content, moving out owned storage.
    std::vector<double> Release();

private:
    explicit OutputBuffer(ArrayView<double> external);
    explicit OutputBuffer(size_t length);

private:
    std::vector<double> storage_;
    ArrayView<double> view_;
    bool owns_storage_;

    DISALLOW_COPY_AND_ASSIGN(OutputBuffer);
};

} // namespace quickfilter

#endif
