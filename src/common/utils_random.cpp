#include "common/utils_random.hpp"

namespace quickfilter {
namespace utils {
namespace random {
namespace {

std::mt19937 MakeEngine(std::optional<uint32_t> seed) {
    return std::mt19937(seed ? *seed : std::random_device()());
}

} // namespace

std::vector<double> random_normal_sequence(size_t size,
                                           double mean,
                                           double stddev,
                                           std::optional<uint32_t> seed) {
    std::mt19937 engine = MakeEngine(seed);
    std::normal_distribution<double> dist(mean, stddev);
    std::vector<double> samples(size);
    for (auto& sample : samples) {
        sample = dist(engine);
    }
    return samples;
}

std::vector<double> random_integer_sequence(size_t size,
                                            int lhs,
                                            int rhs,
                                            std::optional<uint32_t> seed) {
    assert(lhs <= rhs);
    std::mt19937 engine = MakeEngine(seed);
    std::uniform_int_distribution<int> dist(lhs, rhs);
    std::vector<double> samples(size);
    for (auto& sample : samples) {
        sample = dist(engine);
    }
    return samples;
}

} // namespace random
} // namespace utils
} // namespace quickfilter
