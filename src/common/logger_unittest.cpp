#include "common/logger.hpp"
#include "quickfilter/filter_defines.hpp"
#include "quickfilter/filter_errors.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

#include <string>
#include <vector>

using ::testing::Contains;
using ::testing::HasSubstr;

namespace quickfilter {
namespace test {

MY_TEST(LoggerTest, ForwardsRecordsToCallback) {
    static std::vector<std::string> messages;
    static std::vector<logging::Level> levels;
    logging::InitLogger(logging::Level::WARNING, [](logging::Level level, std::string message) {
        levels.push_back(level);
        messages.push_back(std::move(message));
        return true;
    });

    EXPECT_THROW(EdgeModeFromString("sideways"), InvalidModeError);
    ASSERT_FALSE(messages.empty());
    EXPECT_THAT(messages.back(), HasSubstr("sideways"));
    EXPECT_THAT(levels, Contains(logging::Level::WARNING));

    // Below the configured severity.
    const size_t count = messages.size();
    PLOG_DEBUG << "not forwarded";
    EXPECT_EQ(count, messages.size());

    // Hand records back to the console.
    logging::InitLogger(logging::Level::WARNING, [](logging::Level, std::string) { return false; });
}

} // namespace test
} // namespace quickfilter
