#ifndef _FILTER_BENCH_REFERENCE_FILTER_H_
#define _FILTER_BENCH_REFERENCE_FILTER_H_

#include <quickfilter/filter_defines.hpp>

#include <vector>

namespace bench {

// Straightforward "same" sized filter: pads with the same edge rules,
// then copies every window and partially sorts it. O(n * w).
std::vector<double> ReferenceFilter(const std::vector<double>& signal,
                                    size_t window_size,
                                    double percent,
                                    quickfilter::EdgeMode edge_mode,
                                    double constant_value);

} // namespace bench

#endif
