#include "reference_filter.hpp"

#include <quickfilter/edge_extender.hpp>

#include <algorithm>
#include <cmath>

namespace bench {

std::vector<double> ReferenceFilter(const std::vector<double>& signal,
                                    size_t window_size,
                                    double percent,
                                    quickfilter::EdgeMode edge_mode,
                                    double constant_value) {
    const auto extended = quickfilter::ExtendEdges(signal, window_size, edge_mode, constant_value);
    const size_t rank = std::min(static_cast<size_t>(std::floor(window_size * percent)), window_size - 1);

    std::vector<double> window(window_size);
    std::vector<double> out(signal.size());
    for (size_t j = 0; j < out.size(); ++j) {
        std::copy(extended.begin() + j, extended.begin() + j + window_size, window.begin());
        std::nth_element(window.begin(), window.begin() + rank, window.end());
        out[j] = window[rank];
    }
    return out;
}

} // namespace bench
