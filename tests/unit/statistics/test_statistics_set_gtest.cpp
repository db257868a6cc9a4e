#include <gtest/gtest.h>
#include <stdexcept>

#include "src/core/statistics/StatisticsSet.hpp"

using target_finder::statistics::StatisticsSet;

class StatisticsSetTest : public ::testing::Test {
protected:
    StatisticsSet set;
};

TEST_F(StatisticsSetTest, AddNameReturnsExistingIndex) {
    const size_t detect = set.addName("detect");
    const size_t match = set.addName("match");

    EXPECT_EQ(detect, 0u);
    EXPECT_EQ(match, 1u);
    EXPECT_EQ(set.addName("detect"), detect);
    EXPECT_EQ(set.size(), 2u);
}

TEST_F(StatisticsSetTest, NamesKeepInsertionOrder) {
    set.addName("resize");
    set.addName("detect");
    set.addName("draw");

    EXPECT_EQ(set.nameAt(0), "resize");
    EXPECT_EQ(set.nameAt(1), "detect");
    EXPECT_EQ(set.nameAt(2), "draw");
}

TEST_F(StatisticsSetTest, SamplesRouteToTheirStatistic) {
    const size_t detect = set.addName("detect");
    set.addSample(detect, 4.0);
    set.addSample(detect, 6.0);
    set.addNamedSample("match", 1.0);

    EXPECT_TRUE(set.contains("match"));
    EXPECT_EQ(set.at("detect").count(), 2u);
    EXPECT_DOUBLE_EQ(set.at("detect").mean(), 5.0);
    EXPECT_EQ(set.at(set.indexOf("match")).count(), 1u);
}

TEST_F(StatisticsSetTest, SumOfMeansAddsEveryStatistic) {
    set.addNamedSample("a", 2.0);
    set.addNamedSample("b", 3.0);
    set.addNamedSample("b", 5.0);
    set.addName("empty");

    EXPECT_DOUBLE_EQ(set.sumOfMeans(), 6.0);
}

TEST_F(StatisticsSetTest, ClearKeepsNamesButDropsSamples) {
    set.addNamedSample("detect", 2.0);
    set.clear();

    EXPECT_EQ(set.size(), 1u);
    EXPECT_TRUE(set.contains("detect"));
    EXPECT_EQ(set.at("detect").count(), 0u);
    EXPECT_DOUBLE_EQ(set.sumOfMeans(), 0.0);
}

TEST_F(StatisticsSetTest, UnknownEntriesThrow) {
    set.addName("detect");

    EXPECT_THROW(set.addSample(5, 1.0), std::out_of_range);
    EXPECT_THROW(set.at(3), std::out_of_range);
    EXPECT_THROW(set.at("missing"), std::out_of_range);
    EXPECT_THROW(set.nameAt(1), std::out_of_range);
    EXPECT_FALSE(set.contains("missing"));
}
