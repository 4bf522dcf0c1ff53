#include "quickfilter/select_filter.hpp"
#include "quickfilter/edge_extender.hpp"
#include "quickfilter/filter_errors.hpp"
#include "common/utils_random.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

using ::testing::Each;
using ::testing::ElementsAre;
using ::testing::ElementsAreArray;
using ::testing::IsEmpty;

namespace quickfilter {
namespace test {
namespace {

const std::vector<double> kRamp = {1, 2, 3, 4, 5, 6};

// Sorts every window from scratch.
std::vector<double> BruteForceFilter(const std::vector<double>& signal,
                                     const SelectFilter::Configuration& config) {
    const size_t window_size = config.window_size;
    std::vector<double> working;
    size_t out_len = 0;
    switch (config.truncate_mode) {
    case TruncateMode::VALID:
        working = signal;
        out_len = signal.size() - window_size;
        break;
    case TruncateMode::SAME:
        working = ExtendEdges(signal, window_size, config.edge_mode, config.constant_value);
        out_len = signal.size();
        break;
    case TruncateMode::FULL:
        working = ExtendEdges(signal, window_size - 1, window_size, config.edge_mode, config.constant_value);
        out_len = signal.size() + window_size - 1;
        break;
    }
    std::vector<double> out;
    for (size_t j = 0; j < out_len; ++j) {
        std::vector<double> window(working.begin() + j, working.begin() + j + window_size);
        std::sort(window.begin(), window.end());
        size_t rank = config.index ? static_cast<size_t>(*config.index)
                                   : static_cast<size_t>(std::floor(window_size * config.percent));
        out.push_back(window[std::min(rank, window_size - 1)]);
    }
    return out;
}

} // namespace

MY_TEST(SelectFilterTest, MedianSameEvenWindow) {
    EXPECT_THAT(QuickFilter(kRamp, 4), ElementsAre(1, 2, 3, 4, 5, 5));
}

MY_TEST(SelectFilterTest, ValidModeWithIndex) {
    const std::vector<double> signal = {5, 3, 8, 1, 9, 2};
    // Windows [5 3 8], [3 8 1], [8 1 9].
    EXPECT_THAT(QuickFilter(signal, 3, 0, 0.5, std::nullopt, "constant", "valid"),
                ElementsAre(3, 1, 1));
    EXPECT_THAT(QuickFilter(signal, 3, 1, 0.5, std::nullopt, "constant", "valid"),
                ElementsAre(5, 3, 8));
    EXPECT_THAT(QuickFilter(signal, 3, 2, 0.5, std::nullopt, "constant", "valid"),
                ElementsAre(8, 8, 9));
}

MY_TEST(SelectFilterTest, IndexOverridesPercent) {
    SelectFilter::Configuration config(4);
    config.index = 0;
    config.percent = 0.9;
    SelectFilter filter(config);
    EXPECT_DOUBLE_EQ(0.0, filter.effective_percent());
    EXPECT_THAT(filter.Apply(kRamp), ElementsAre(0, 0, 1, 2, 3, 0));
}

MY_TEST(SelectFilterTest, IndexEqualToWindowSizeSelectsMaximum) {
    EXPECT_THAT(QuickFilter(kRamp, 4, 4, 0.5, std::nullopt, "nearest"),
                ElementsAre(2, 3, 4, 5, 6, 6));
    EXPECT_THAT(QuickFilter(kRamp, 4, 3, 0.5, std::nullopt, "nearest"),
                ElementsAre(2, 3, 4, 5, 6, 6));
}

MY_TEST(SelectFilterTest, IndexSelectsExactRank) {
    // 1 / 49 * 49 rounds below 1 in floating point.
    std::vector<double> signal(60);
    for (size_t i = 0; i < signal.size(); ++i) {
        signal[i] = static_cast<double>(i);
    }
    const auto out = QuickFilter(signal, 49, 1, 0.5, std::nullopt, "constant", "valid");
    ASSERT_EQ(11u, out.size());
    for (size_t j = 0; j < out.size(); ++j) {
        EXPECT_EQ(static_cast<double>(j + 1), out[j]);
    }
}

MY_TEST(SelectFilterTest, OutputLengths) {
    for (size_t window_size = 1; window_size <= kRamp.size(); ++window_size) {
        for (auto truncate_mode : {TruncateMode::VALID, TruncateMode::SAME, TruncateMode::FULL}) {
            SelectFilter::Configuration config(window_size);
            config.truncate_mode = truncate_mode;
            SelectFilter filter(config);
            const size_t expected = truncate_mode == TruncateMode::VALID ? kRamp.size() - window_size
                                  : truncate_mode == TruncateMode::SAME  ? kRamp.size()
                                                                         : kRamp.size() + window_size - 1;
            EXPECT_EQ(expected, filter.OutputLength(kRamp.size()));
            EXPECT_EQ(expected, filter.Apply(kRamp).size());
        }
    }
}

MY_TEST(SelectFilterTest, ValidModeWithWindowAsLongAsSignal) {
    EXPECT_THAT(QuickFilter(kRamp, 6, std::nullopt, 0.5, std::nullopt, "constant", "valid"), IsEmpty());
}

MY_TEST(SelectFilterTest, WindowOfOneIsIdentity) {
    for (auto edge_mode : {"constant", "nearest", "reflect", "mirror", "wrap"}) {
        EXPECT_THAT(QuickFilter(kRamp, 1, std::nullopt, 0.5, std::nullopt, edge_mode), ElementsAreArray(kRamp));
    }
}

MY_TEST(SelectFilterTest, MedianSameOddWindow) {
    const std::vector<double> signal = {1, 2, 3, 4, 5};
    EXPECT_THAT(QuickFilter(signal, 3), ElementsAre(1, 2, 3, 4, 4));
}

MY_TEST(SelectFilterTest, RemovesOutliers) {
    const std::vector<double> signal = {1, 1, 1, 100, 1, 1, -50, 1, 1};
    EXPECT_THAT(QuickFilter(signal, 3, std::nullopt, 0.5, std::nullopt, "nearest"), Each(1.0));
}

MY_TEST(SelectFilterTest, WrapSameMinAndMax) {
    // Extended signal: 5 6 | 1 2 3 4 5 6 | 1 2
    EXPECT_THAT(QuickFilter(kRamp, 4, 0, 0.5, std::nullopt, "wrap"),
                ElementsAre(1, 1, 1, 2, 3, 1));
    EXPECT_THAT(QuickFilter(kRamp, 4, 3, 0.5, std::nullopt, "wrap"),
                ElementsAre(6, 6, 4, 5, 6, 6));
}

MY_TEST(SelectFilterTest, ReflectAndMirrorDiffer) {
    // reflect: 2 1 | 1 2 3 4 5 6 | 6 5
    // mirror:  3 2 | 1 2 3 4 5 6 | 5 4
    EXPECT_THAT(QuickFilter(kRamp, 4, 3, 0.5, std::nullopt, "reflect"),
                ElementsAre(2, 3, 4, 5, 6, 6));
    EXPECT_THAT(QuickFilter(kRamp, 4, 3, 0.5, std::nullopt, "mirror"),
                ElementsAre(3, 3, 4, 5, 6, 6));
    EXPECT_THAT(QuickFilter(kRamp, 4, 0, 0.5, std::nullopt, "reflect"),
                ElementsAre(1, 1, 1, 2, 3, 4));
    EXPECT_THAT(QuickFilter(kRamp, 4, 0, 0.5, std::nullopt, "mirror"),
                ElementsAre(1, 1, 1, 2, 3, 4));
}

MY_TEST(SelectFilterTest, FullModeCoversPartialOverlaps) {
    const std::vector<double> signal = {1, 2, 3};
    // Extended signal: 0 | 1 2 3 | 0 0
    EXPECT_THAT(QuickFilter(signal, 2, 1, 0.5, std::nullopt, "constant", "full"),
                ElementsAre(1, 2, 3, 3));
    EXPECT_THAT(QuickFilter(signal, 2, 0, 0.5, std::nullopt, "constant", "full"),
                ElementsAre(0, 1, 2, 0));
}

MY_TEST(SelectFilterTest, FullModeMedianNearest) {
    const std::vector<double> signal = {4, 1, 3, 2};
    // Extended signal: 4 4 | 4 1 3 2 | 2 2 2
    EXPECT_THAT(QuickFilter(signal, 3, std::nullopt, 0.5, std::nullopt, "nearest", "full"),
                ElementsAre(4, 4, 3, 2, 2, 2));
}

MY_TEST(SelectFilterTest, WritesIntoCallerBuffer) {
    std::vector<double> output(kRamp.size(), -1.0);
    SelectFilter filter(SelectFilter::Configuration(4));
    filter.Apply(kRamp, ArrayView<double>(output));
    EXPECT_THAT(output, ElementsAre(1, 2, 3, 4, 5, 5));

    std::vector<double> other(kRamp.size(), -1.0);
    const auto returned = QuickFilter(kRamp, 4, std::nullopt, 0.5, ArrayView<double>(other));
    EXPECT_THAT(other, ElementsAre(1, 2, 3, 4, 5, 5));
    EXPECT_EQ(other, returned);
}

MY_TEST(SelectFilterTest, DoesNotModifyInput) {
    std::vector<double> signal = {3, -1, 4, 1, -5, 9, 2, 6};
    const auto copy = signal;
    for (auto truncate_mode : {"valid", "same", "full"}) {
        QuickFilter(signal, 3, std::nullopt, 0.5, std::nullopt, "reflect", truncate_mode);
    }
    EXPECT_EQ(copy, signal);
}

MY_TEST(SelectFilterTest, MatchesBruteForceOnRandomSignals) {
    const auto normal = utils::random::random_normal_sequence(200, 0.0, 1.0, 7);
    // Plenty of ties.
    const auto integers = utils::random::random_integer_sequence(200, 0, 3, 11);
    for (const auto* signal : {&normal, &integers}) {
        for (size_t window_size : {1u, 2u, 5u, 8u, 31u}) {
            for (auto edge_mode : {EdgeMode::CONSTANT, EdgeMode::NEAREST, EdgeMode::REFLECT, EdgeMode::MIRROR, EdgeMode::WRAP}) {
                for (auto truncate_mode : {TruncateMode::VALID, TruncateMode::SAME, TruncateMode::FULL}) {
                    for (double percent : {0.0, 0.25, 0.5, 0.75, 1.0}) {
                        SelectFilter::Configuration config(window_size);
                        config.percent = percent;
                        config.edge_mode = edge_mode;
                        config.truncate_mode = truncate_mode;
                        config.constant_value = -0.5;
                        SelectFilter filter(config);
                        ASSERT_EQ(BruteForceFilter(*signal, config), filter.Apply(*signal))
                            << "window_size=" << window_size << " edge_mode=" << edge_mode
                            << " truncate_mode=" << truncate_mode << " percent=" << percent;
                    }
                }
            }
        }
    }
}

MY_TEST(SelectFilterTest, RejectsSignalShorterThanWindow) {
    EXPECT_THROW(QuickFilter(kRamp, 7), LengthError);
    EXPECT_THROW(QuickFilter(kRamp, 0), LengthError);
    EXPECT_THROW(QuickFilter(std::vector<double>{}, 1), LengthError);
    EXPECT_THROW(SelectFilter(SelectFilter::Configuration(7)).Apply(kRamp), LengthError);
    EXPECT_THROW(SelectFilter(SelectFilter::Configuration(1)).Apply(std::vector<double>{}), LengthError);
    EXPECT_THROW(SelectFilter(SelectFilter::Configuration(7)).OutputLength(kRamp.size()), LengthError);
}

MY_TEST(SelectFilterTest, RejectsUnknownModes) {
    EXPECT_THROW(QuickFilter(kRamp, 3, std::nullopt, 0.5, std::nullopt, "extrapolate"), InvalidModeError);
    EXPECT_THROW(QuickFilter(kRamp, 3, std::nullopt, 0.5, std::nullopt, "constant", "partial"), InvalidModeError);

    SelectFilter::Configuration bad_edge(3);
    bad_edge.edge_mode = static_cast<EdgeMode>(99);
    EXPECT_THROW(SelectFilter(bad_edge).Apply(kRamp), InvalidModeError);

    SelectFilter::Configuration bad_truncate(3);
    bad_truncate.truncate_mode = static_cast<TruncateMode>(99);
    EXPECT_THROW(SelectFilter(bad_truncate).Apply(kRamp), InvalidModeError);
    EXPECT_THROW(SelectFilter(bad_truncate).OutputLength(kRamp.size()), InvalidModeError);
}

MY_TEST(SelectFilterTest, RejectsSelectionOutOfRange) {
    EXPECT_THROW(QuickFilter(kRamp, 3, std::nullopt, 1.5), SelectionRangeError);
    EXPECT_THROW(QuickFilter(kRamp, 3, std::nullopt, -0.1), SelectionRangeError);
    EXPECT_THROW(QuickFilter(kRamp, 3, std::nullopt, std::numeric_limits<double>::quiet_NaN()), SelectionRangeError);
    EXPECT_THROW(QuickFilter(kRamp, 3, -1), SelectionRangeError);
    EXPECT_THROW(QuickFilter(kRamp, 3, 4), SelectionRangeError);
}

MY_TEST(SelectFilterTest, RejectsNaNSamples) {
    const std::vector<double> signal = {1, std::numeric_limits<double>::quiet_NaN(), 3};
    EXPECT_THROW(QuickFilter(signal, 2), InvalidSampleError);
    EXPECT_THROW(QuickFilter(kRamp, 2, std::nullopt, 0.5, std::nullopt, "constant", "same",
                             std::numeric_limits<double>::quiet_NaN()),
                 InvalidSampleError);
    // The padding value is unused without edge extension.
    EXPECT_NO_THROW(QuickFilter(kRamp, 2, std::nullopt, 0.5, std::nullopt, "constant", "valid",
                                std::numeric_limits<double>::quiet_NaN()));
}

MY_TEST(SelectFilterTest, RejectsMismatchedOutputBuffer) {
    std::vector<double> output(kRamp.size() - 1, 42.0);
    EXPECT_THROW(QuickFilter(kRamp, 3, std::nullopt, 0.5, ArrayView<double>(output)), OutputLengthMismatchError);
    EXPECT_THROW(QuickFilter(kRamp, 3, std::nullopt, 0.5, ArrayView<double>(output), "constant", "full"),
                 OutputLengthMismatchError);
    EXPECT_THAT(output, Each(42.0));
}

MY_TEST(SelectFilterTest, FailuresLeaveCallerBufferUntouched) {
    std::vector<double> output(kRamp.size(), 42.0);
    const ArrayView<double> view(output);
    EXPECT_THROW(QuickFilter(kRamp, 7, std::nullopt, 0.5, view), LengthError);
    EXPECT_THROW(QuickFilter(kRamp, 3, std::nullopt, 0.5, view, "bogus"), InvalidModeError);
    EXPECT_THROW(QuickFilter(kRamp, 3, std::nullopt, 2.0, view), SelectionRangeError);
    EXPECT_THROW(QuickFilter(kRamp, 3, std::nullopt, 0.5, view, "constant", "bogus"), InvalidModeError);
    EXPECT_THAT(output, Each(42.0));
}

} // namespace test
} // namespace quickfilter
