#include "quickfilter/order_statistic_tree.hpp"
#include "common/utils_random.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <sstream>

using ::testing::ElementsAre;

namespace quickfilter {
namespace test {

MY_TEST(OrderStatisticTreeTest, EmptyTree) {
    OrderStatisticTree<int> tree;
    EXPECT_TRUE(tree.empty());
    EXPECT_EQ(0u, tree.size());
    EXPECT_TRUE(tree.ToVector().empty());
    EXPECT_THROW(tree.Select(0.5), std::out_of_range);
    EXPECT_THROW(tree.SelectRank(0), std::out_of_range);
}

MY_TEST(OrderStatisticTreeTest, KeepsSortedOrder) {
    OrderStatisticTree<int> tree;
    for (int value : {5, 1, 4, 2, 3}) {
        tree.Insert(value);
    }
    EXPECT_EQ(5u, tree.size());
    EXPECT_THAT(tree.ToVector(), ElementsAre(1, 2, 3, 4, 5));
}

MY_TEST(OrderStatisticTreeTest, SelectsByPercentile) {
    OrderStatisticTree<int> tree;
    for (int value : {5, 1, 4, 2, 3}) {
        tree.Insert(value);
    }
    // Pairs of {percentile, value} computed by hand.
    const std::vector<std::pair<double, int>> kTestPercentiles = {
        {0.0, 1}, {0.1, 1}, {0.5, 3}, {0.99, 5}, {1.0, 5}};
    for (const auto& test_percentile : kTestPercentiles) {
        EXPECT_EQ(test_percentile.second, tree.Select(test_percentile.first));
    }
}

MY_TEST(OrderStatisticTreeTest, MinAndMax) {
    OrderStatisticTree<double> tree;
    for (double value : {0.5, -3.25, 7.0, 2.0}) {
        tree.Insert(value);
    }
    EXPECT_EQ(-3.25, tree.Select(0.0));
    EXPECT_EQ(7.0, tree.SelectRank(tree.size() - 1));
    EXPECT_EQ(7.0, tree.Select(1.0));
}

MY_TEST(OrderStatisticTreeTest, RejectsPercentileOutOfRange) {
    OrderStatisticTree<int> tree;
    tree.Insert(1);
    EXPECT_THROW(tree.Select(-0.01), SelectionRangeError);
    EXPECT_THROW(tree.Select(1.01), SelectionRangeError);
    EXPECT_THROW(tree.Select(std::numeric_limits<double>::quiet_NaN()), SelectionRangeError);
    EXPECT_THROW(tree.SelectRank(1), std::out_of_range);
}

MY_TEST(OrderStatisticTreeTest, DuplicatesAreFungible) {
    OrderStatisticTree<int> tree;
    for (int value : {2, 2, 1, 2}) {
        tree.Insert(value);
    }
    EXPECT_THAT(tree.ToVector(), ElementsAre(1, 2, 2, 2));
    EXPECT_EQ(2, tree.SelectRank(1));
    EXPECT_EQ(2, tree.SelectRank(3));

    EXPECT_TRUE(tree.Erase(2));
    EXPECT_THAT(tree.ToVector(), ElementsAre(1, 2, 2));
    EXPECT_TRUE(tree.Erase(2));
    EXPECT_TRUE(tree.Erase(2));
    EXPECT_THAT(tree.ToVector(), ElementsAre(1));
    EXPECT_FALSE(tree.Erase(2));
    EXPECT_EQ(1u, tree.size());
}

MY_TEST(OrderStatisticTreeTest, EraseMissingValueIsNoOp) {
    OrderStatisticTree<int> tree;
    EXPECT_FALSE(tree.Erase(1));
    tree.Insert(1);
    tree.Insert(3);
    EXPECT_FALSE(tree.Erase(2));
    EXPECT_FALSE(tree.Erase(4));
    EXPECT_THAT(tree.ToVector(), ElementsAre(1, 3));
}

MY_TEST(OrderStatisticTreeTest, InsertThenEraseRestoresContent) {
    OrderStatisticTree<double> tree;
    for (double value : {4.0, 1.0, 1.0, 9.0, -2.0, 6.0}) {
        tree.Insert(value);
    }
    const auto before = tree.ToVector();
    for (double value : {1.0, 5.0, -10.0, 9.0}) {
        tree.Insert(value);
        EXPECT_TRUE(tree.Erase(value));
        EXPECT_EQ(before, tree.ToVector());
    }
}

MY_TEST(OrderStatisticTreeTest, EraseInnerNodes) {
    OrderStatisticTree<int> tree;
    for (int value = 1; value <= 15; ++value) {
        tree.Insert(value);
    }
    // Nodes with two children end up replaced by their successor.
    for (int value : {8, 4, 12, 2, 6}) {
        EXPECT_TRUE(tree.Erase(value));
    }
    EXPECT_THAT(tree.ToVector(), ElementsAre(1, 3, 5, 7, 9, 10, 11, 13, 14, 15));
    EXPECT_EQ(7, tree.SelectRank(3));
}

MY_TEST(OrderStatisticTreeTest, Reset) {
    OrderStatisticTree<int> tree;
    tree.Insert(3);
    tree.Insert(3);
    tree.Reset();
    EXPECT_TRUE(tree.empty());
    tree.Insert(7);
    EXPECT_EQ(7, tree.Select(0.5));
}

MY_TEST(OrderStatisticTreeTest, PrintsSortedContent) {
    OrderStatisticTree<int> tree;
    std::ostringstream empty_out;
    empty_out << tree;
    EXPECT_EQ("[]", empty_out.str());

    tree.Insert(3);
    tree.Insert(1);
    tree.Insert(3);
    std::ostringstream out;
    out << tree;
    EXPECT_EQ("[1, 3, 3]", out.str());
}

MY_TEST(OrderStatisticTreeTest, MatchesSortedVectorUnderRandomUpdates) {
    OrderStatisticTree<double> tree;
    std::vector<double> expected;
    std::mt19937 engine(1234);
    const auto values = utils::random::random_integer_sequence(2000, -50, 50, 42);
    for (size_t i = 0; i < values.size(); ++i) {
        std::uniform_int_distribution<int> coin(0, 2);
        if (!expected.empty() && coin(engine) == 0) {
            std::uniform_int_distribution<size_t> pick(0, expected.size() - 1);
            const double victim = expected[pick(engine)];
            EXPECT_TRUE(tree.Erase(victim));
            expected.erase(std::find(expected.begin(), expected.end(), victim));
        } else {
            tree.Insert(values[i]);
            expected.insert(std::upper_bound(expected.begin(), expected.end(), values[i]), values[i]);
        }
        ASSERT_EQ(expected.size(), tree.size());
        if (i % 97 == 0) {
            for (size_t rank = 0; rank < expected.size(); ++rank) {
                ASSERT_EQ(expected[rank], tree.SelectRank(rank));
            }
        }
    }
    EXPECT_EQ(expected, tree.ToVector());
}

} // namespace test
} // namespace quickfilter
