#include "quickfilter/filter_defines.hpp"
#include "quickfilter/filter_errors.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

#include <sstream>

namespace quickfilter {
namespace test {

MY_TEST(FilterDefinesTest, ParsesEdgeModes) {
    EXPECT_EQ(EdgeMode::CONSTANT, EdgeModeFromString("constant"));
    EXPECT_EQ(EdgeMode::NEAREST, EdgeModeFromString("nearest"));
    EXPECT_EQ(EdgeMode::REFLECT, EdgeModeFromString("reflect"));
    EXPECT_EQ(EdgeMode::MIRROR, EdgeModeFromString("mirror"));
    EXPECT_EQ(EdgeMode::WRAP, EdgeModeFromString("wrap"));
}

MY_TEST(FilterDefinesTest, ParsesTruncateModes) {
    EXPECT_EQ(TruncateMode::VALID, TruncateModeFromString("valid"));
    EXPECT_EQ(TruncateMode::SAME, TruncateModeFromString("same"));
    EXPECT_EQ(TruncateMode::FULL, TruncateModeFromString("full"));
}

MY_TEST(FilterDefinesTest, RejectsUnknownNames) {
    EXPECT_THROW(EdgeModeFromString("Constant"), InvalidModeError);
    EXPECT_THROW(EdgeModeFromString(""), InvalidModeError);
    EXPECT_THROW(TruncateModeFromString("partial"), InvalidModeError);
}

MY_TEST(FilterDefinesTest, NamesRoundTrip) {
    for (auto mode : {EdgeMode::CONSTANT, EdgeMode::NEAREST, EdgeMode::REFLECT, EdgeMode::MIRROR, EdgeMode::WRAP}) {
        EXPECT_TRUE(IsValid(mode));
        EXPECT_EQ(mode, EdgeModeFromString(ToString(mode)));
    }
    for (auto mode : {TruncateMode::VALID, TruncateMode::SAME, TruncateMode::FULL}) {
        EXPECT_TRUE(IsValid(mode));
        EXPECT_EQ(mode, TruncateModeFromString(ToString(mode)));
    }
}

MY_TEST(FilterDefinesTest, OutOfRangeEnumsAreInvalid) {
    EXPECT_FALSE(IsValid(static_cast<EdgeMode>(17)));
    EXPECT_FALSE(IsValid(static_cast<TruncateMode>(17)));
    EXPECT_EQ("unknown", ToString(static_cast<EdgeMode>(17)));
}

MY_TEST(FilterDefinesTest, StreamsNames) {
    std::ostringstream out;
    out << EdgeMode::MIRROR << "/" << TruncateMode::FULL;
    EXPECT_EQ("mirror/full", out.str());
}

} // namespace test
} // namespace quickfilter
