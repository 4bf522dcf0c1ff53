#include "quickfilter/output_buffer.hpp"
#include "quickfilter/filter_errors.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using ::testing::Each;
using ::testing::ElementsAre;

namespace quickfilter {
namespace test {

MY_TEST(OutputBufferTest, AllocatesZeroInitialized) {
    OutputBuffer buffer = OutputBuffer::Prepare(std::nullopt, 5);
    EXPECT_TRUE(buffer.owns_storage());
    ASSERT_EQ(5u, buffer.size());
    buffer[4] = 2.5;
    EXPECT_THAT(buffer.Release(), ElementsAre(0, 0, 0, 0, 2.5));
}

MY_TEST(OutputBufferTest, AllocatesEmpty) {
    OutputBuffer buffer = OutputBuffer::Prepare(std::nullopt, 0);
    EXPECT_EQ(0u, buffer.size());
    EXPECT_TRUE(buffer.Release().empty());
}

MY_TEST(OutputBufferTest, WritesThroughToCallerBuffer) {
    std::vector<double> storage(3, 7.0);
    OutputBuffer buffer = OutputBuffer::Prepare(ArrayView<double>(storage), 3);
    EXPECT_FALSE(buffer.owns_storage());
    EXPECT_EQ(storage.data(), buffer.view().data());
    // Caller content is not cleared.
    EXPECT_EQ(7.0, buffer[1]);
    buffer[0] = 1.0;
    EXPECT_THAT(storage, ElementsAre(1.0, 7.0, 7.0));
    EXPECT_THAT(buffer.Release(), ElementsAre(1.0, 7.0, 7.0));
    // Releasing copies, the caller keeps its storage.
    EXPECT_EQ(3u, storage.size());
}

MY_TEST(OutputBufferTest, RejectsWrongLength) {
    std::vector<double> storage(4, 7.0);
    EXPECT_THROW(OutputBuffer::Prepare(ArrayView<double>(storage), 3), OutputLengthMismatchError);
    EXPECT_THROW(OutputBuffer::Prepare(ArrayView<double>(storage), 5), OutputLengthMismatchError);
    EXPECT_THAT(storage, Each(7.0));
}

} // namespace test
} // namespace quickfilter
