#include "quickfilter/edge_extender.hpp"
#include "quickfilter/filter_errors.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using ::testing::ElementsAre;
using ::testing::ElementsAreArray;

namespace quickfilter {
namespace test {
namespace {

const std::vector<double> kSignal = {1, 2, 3, 4, 5, 6};

} // namespace

MY_TEST(EdgeExtenderTest, ConstantEvenWindow) {
    EXPECT_THAT(ExtendEdges(kSignal, 4, EdgeMode::CONSTANT, 9.0),
                ElementsAre(9, 9, 1, 2, 3, 4, 5, 6, 9, 9));
}

MY_TEST(EdgeExtenderTest, NearestEvenWindow) {
    EXPECT_THAT(ExtendEdges(kSignal, 4, EdgeMode::NEAREST),
                ElementsAre(1, 1, 1, 2, 3, 4, 5, 6, 6, 6));
}

MY_TEST(EdgeExtenderTest, ReflectRepeatsEdgeSample) {
    EXPECT_THAT(ExtendEdges(kSignal, 4, EdgeMode::REFLECT),
                ElementsAre(2, 1, 1, 2, 3, 4, 5, 6, 6, 5));
}

MY_TEST(EdgeExtenderTest, MirrorSkipsEdgeSample) {
    EXPECT_THAT(ExtendEdges(kSignal, 4, EdgeMode::MIRROR),
                ElementsAre(3, 2, 1, 2, 3, 4, 5, 6, 5, 4));
}

MY_TEST(EdgeExtenderTest, WrapUsesOppositeEdge) {
    const auto extended = ExtendEdges(kSignal, 4, EdgeMode::WRAP);
    ASSERT_EQ(kSignal.size() + 4, extended.size());
    // Trailing samples in front, leading samples at the back.
    EXPECT_THAT(std::vector<double>(extended.begin(), extended.begin() + 2), ElementsAre(5, 6));
    EXPECT_THAT(std::vector<double>(extended.end() - 2, extended.end()), ElementsAre(1, 2));
    EXPECT_THAT(std::vector<double>(extended.begin() + 2, extended.end() - 2), ElementsAreArray(kSignal));
}

MY_TEST(EdgeExtenderTest, OddWindowPadsOneMoreAtTheBack) {
    EXPECT_THAT(ExtendEdges(kSignal, 3, EdgeMode::CONSTANT),
                ElementsAre(0, 1, 2, 3, 4, 5, 6, 0, 0));
    EXPECT_THAT(ExtendEdges(kSignal, 3, EdgeMode::NEAREST),
                ElementsAre(1, 1, 2, 3, 4, 5, 6, 6, 6));
    EXPECT_THAT(ExtendEdges(kSignal, 3, EdgeMode::REFLECT),
                ElementsAre(1, 1, 2, 3, 4, 5, 6, 6, 5));
    EXPECT_THAT(ExtendEdges(kSignal, 3, EdgeMode::MIRROR),
                ElementsAre(2, 1, 2, 3, 4, 5, 6, 5, 4));
    EXPECT_THAT(ExtendEdges(kSignal, 3, EdgeMode::WRAP),
                ElementsAre(6, 1, 2, 3, 4, 5, 6, 1, 2));
}

MY_TEST(EdgeExtenderTest, ExtendedLengthIsSignalPlusWindow) {
    for (size_t window_size = 1; window_size <= kSignal.size(); ++window_size) {
        for (auto mode : {EdgeMode::CONSTANT, EdgeMode::NEAREST, EdgeMode::REFLECT, EdgeMode::MIRROR, EdgeMode::WRAP}) {
            EXPECT_EQ(kSignal.size() + window_size, ExtendEdges(kSignal, window_size, mode).size());
        }
    }
}

MY_TEST(EdgeExtenderTest, PaddingLongerThanSignal) {
    const std::vector<double> signal = {1, 2, 3};
    EXPECT_THAT(ExtendEdges(signal, 5, 5, EdgeMode::WRAP),
                ElementsAre(2, 3, 1, 2, 3, 1, 2, 3, 1, 2, 3, 1, 2));
    EXPECT_THAT(ExtendEdges(signal, 4, 0, EdgeMode::REFLECT),
                ElementsAre(3, 3, 2, 1, 1, 2, 3));
    EXPECT_THAT(ExtendEdges(std::vector<double>{1, 2}, 3, 0, EdgeMode::MIRROR),
                ElementsAre(2, 1, 2, 1, 2));
}

MY_TEST(EdgeExtenderTest, MirrorSingleSample) {
    EXPECT_THAT(ExtendEdges(std::vector<double>{7}, 2, 2, EdgeMode::MIRROR),
                ElementsAre(7, 7, 7, 7, 7));
}

MY_TEST(EdgeExtenderTest, ZeroPaddingCopiesSignal) {
    EXPECT_THAT(ExtendEdges(kSignal, 0, 0, EdgeMode::WRAP), ElementsAreArray(kSignal));
}

MY_TEST(EdgeExtenderTest, RejectsEmptySignal) {
    EXPECT_THROW(ExtendEdges(std::vector<double>{}, 2, EdgeMode::CONSTANT), LengthError);
}

MY_TEST(EdgeExtenderTest, RejectsUnknownMode) {
    EXPECT_THROW(ExtendEdges(kSignal, 2, static_cast<EdgeMode>(42)), InvalidModeError);
}

} // namespace test
} // namespace quickfilter
