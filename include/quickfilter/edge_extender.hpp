#ifndef _QUICKFILTER_EDGE_EXTENDER_H_
#define _QUICKFILTER_EDGE_EXTENDER_H_

#include "base/defines.hpp"
#include "common/array_view.hpp"
#include "quickfilter/filter_defines.hpp"

#include <vector>

namespace quickfilter {

// Returns a copy of `signal` with `front` synthetic samples prepended
// and `back` samples appended, chosen by `mode`. `constant_value` is
// only used by EdgeMode::CONSTANT.
QUICKFILTER_CPP_EXPORT std::vector<double> ExtendEdges(ArrayView<const double> signal,
                                                       size_t front,
                                                       size_t back,
                                                       EdgeMode mode,
                                                       double constant_value = 0.0);

// Pads for a window of `window_size`: `window_size / 2` samples in
// front and the remaining `window_size - window_size / 2` at the back,
// so the result is always `signal.size() + window_size` long.
QUICKFILTER_CPP_EXPORT std::vector<double> ExtendEdges(ArrayView<const double> signal,
                                                       size_t window_size,
                                                       EdgeMode mode,
                                                       double constant_value = 0.0);

} // namespace quickfilter

#endif
