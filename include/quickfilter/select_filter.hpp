#ifndef _QUICKFILTER_SELECT_FILTER_H_
#define _QUICKFILTER_SELECT_FILTER_H_

#include "base/defines.hpp"
#include "common/array_view.hpp"
#include "quickfilter/filter_defines.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace quickfilter {

class OutputBuffer;

// Filters a 1D signal with the k-th smallest element of a sliding
// window. `index` 0 gives a min filter, `window_size - 1` a max filter
// and `percent` 0.5 a median filter.
class QUICKFILTER_CPP_EXPORT SelectFilter {
public:
    struct Configuration {
        explicit Configuration(size_t window_size)
            : window_size(window_size) {}

        size_t window_size;
        // Rank inside the sorted window, overrides `percent` if set.
        std::optional<int64_t> index = std::nullopt;
        // Between 0 and 1.
        double percent = 0.5;
        EdgeMode edge_mode = EdgeMode::CONSTANT;
        TruncateMode truncate_mode = TruncateMode::SAME;
        // Padding value for EdgeMode::CONSTANT.
        double constant_value = 0.0;
    };

    explicit SelectFilter(Configuration config);
    ~SelectFilter();

    const Configuration& config() const { return config_; }

    // The percentile used for selection, `index / window_size` when
    // an index is configured.
    double effective_percent() const;

    // valid: n - window_size
    // same:  n
    // full:  n + window_size - 1
    // Throws LengthError when n < window_size.
    size_t OutputLength(size_t signal_length) const;

    // Throws LengthError, InvalidModeError, SelectionRangeError or
    // InvalidSampleError, all before any output is produced.
    std::vector<double> Apply(ArrayView<const double> signal) const;

    // As above, writing into `output`, which must be exactly
    // OutputLength(signal.size()) long or OutputLengthMismatchError is
    // thrown. `output` is left untouched on failure.
    void Apply(ArrayView<const double> signal, ArrayView<double> output) const;

private:
    void Validate(ArrayView<const double> signal) const;
    void Run(ArrayView<const double> signal, OutputBuffer& output) const;
    // Single left-to-right pass, output[j] is the order statistic over
    // working[j, j + window_size).
    void SlidingPass(ArrayView<const double> working, OutputBuffer& output) const;

private:
    const Configuration config_;
};

// Functional entry point taking the mode names used on the command line:
// edge_mode in {constant, nearest, reflect, mirror, wrap} and
// truncate_mode in {valid, same, full}.
// When `output` is given it's filled, and its content is returned as well.
QUICKFILTER_CPP_EXPORT std::vector<double> QuickFilter(ArrayView<const double> signal,
                                                       size_t window_size,
                                                       std::optional<int64_t> index = std::nullopt,
                                                       double percent = 0.5,
                                                       std::optional<ArrayView<double>> output = std::nullopt,
                                                       std::string_view edge_mode = "constant",
                                                       std::string_view truncate_mode = "same",
                                                       double constant_value = 0.0);

} // namespace quickfilter

#endif
