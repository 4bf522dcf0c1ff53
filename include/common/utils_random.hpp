#ifndef _COMMON_UTILS_RANDOM_H_
#define _COMMON_UTILS_RANDOM_H_

#include "base/defines.hpp"

#include <cassert>
#include <optional>
#include <random>
#include <vector>

namespace quickfilter {
namespace utils {
namespace random {

// Normally distributed samples, reproducible when `seed` is given.
QUICKFILTER_CPP_EXPORT std::vector<double> random_normal_sequence(size_t size,
                                                                  double mean = 0.0,
                                                                  double stddev = 1.0,
                                                                  std::optional<uint32_t> seed = std::nullopt);

// Integers drawn uniformly from [lhs, rhs] and returned as samples,
// handy to get many duplicates.
QUICKFILTER_CPP_EXPORT std::vector<double> random_integer_sequence(size_t size,
                                                                   int lhs,
                                                                   int rhs,
                                                                   std::optional<uint32_t> seed = std::nullopt);

} // namespace random
} // namespace utils
} // namespace quickfilter

#endif
