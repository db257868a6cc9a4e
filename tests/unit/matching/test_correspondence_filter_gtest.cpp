#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <stdexcept>

#include "src/core/matching/CorrespondenceFilter.hpp"

using target_finder::CandidateMatches;
using target_finder::matching::CorrespondenceFilter;

class CorrespondenceFilterTest : public ::testing::Test {
protected:
    CorrespondenceFilter filter;  // default 0.7
};

TEST_F(CorrespondenceFilterTest, DefaultThresholdIsLoweRatio) {
    EXPECT_FLOAT_EQ(filter.getRatioThreshold(), 0.7f);
}

TEST_F(CorrespondenceFilterTest, AcceptsDistinctiveBestMatch) {
    CandidateMatches candidates = {{cv::DMatch(0, 3, 1.0f), cv::DMatch(0, 5, 2.0f)}};

    const auto& accepted = filter.filter(candidates);

    ASSERT_EQ(accepted.size(), 1u);
    EXPECT_EQ(accepted[0].queryIdx, 0);
    EXPECT_EQ(accepted[0].trainIdx, 3);
    EXPECT_FLOAT_EQ(accepted[0].distance, 1.0f);
}

TEST_F(CorrespondenceFilterTest, RejectsAmbiguousBestMatch) {
    CandidateMatches candidates = {{cv::DMatch(0, 3, 1.5f), cv::DMatch(0, 5, 2.0f)}};

    EXPECT_TRUE(filter.filter(candidates).empty()) << "1.5 is not below 0.7 * 2.0";
}

TEST_F(CorrespondenceFilterTest, BoundaryIsStrict) {
    // 0.7f * 2.0f and 1.4f are the same float
    EXPECT_FALSE(CorrespondenceFilter::passesRatioTest({cv::DMatch(0, 0, 1.4f), cv::DMatch(0, 1, 2.0f)}, 0.7f));
}

TEST_F(CorrespondenceFilterTest, ShortCandidateListsAreSkipped) {
    CandidateMatches candidates = {
        {},
        {cv::DMatch(1, 0, 0.1f)},
        {cv::DMatch(2, 4, 0.5f), cv::DMatch(2, 1, 5.0f)}
    };

    const auto& accepted = filter.filter(candidates);

    ASSERT_EQ(accepted.size(), 1u);
    EXPECT_EQ(accepted[0].queryIdx, 2);
}

TEST_F(CorrespondenceFilterTest, PreservesQueryOrderAndDuplicateTargets) {
    CandidateMatches candidates = {
        {cv::DMatch(0, 7, 1.0f), cv::DMatch(0, 2, 10.0f)},
        {cv::DMatch(1, 7, 2.0f), cv::DMatch(1, 3, 10.0f)},
        {cv::DMatch(2, 9, 9.0f), cv::DMatch(2, 1, 10.0f)},
        {cv::DMatch(3, 4, 0.0f), cv::DMatch(3, 5, 1.0f)}
    };

    const auto& accepted = filter.filter(candidates);

    ASSERT_EQ(accepted.size(), 3u);
    EXPECT_EQ(accepted[0].queryIdx, 0);
    EXPECT_EQ(accepted[1].queryIdx, 1);
    EXPECT_EQ(accepted[2].queryIdx, 3);
    EXPECT_EQ(accepted[0].trainIdx, accepted[1].trainIdx) << "Several reference features may map to one scene feature";
}

TEST_F(CorrespondenceFilterTest, ScratchBufferIsClearedBetweenCalls) {
    CandidateMatches first = {
        {cv::DMatch(0, 0, 1.0f), cv::DMatch(0, 1, 10.0f)},
        {cv::DMatch(1, 1, 1.0f), cv::DMatch(1, 0, 10.0f)}
    };
    CandidateMatches second = {{cv::DMatch(5, 2, 1.0f), cv::DMatch(5, 3, 10.0f)}};

    EXPECT_EQ(filter.filter(first).size(), 2u);
    const auto& accepted = filter.filter(second);

    ASSERT_EQ(accepted.size(), 1u);
    EXPECT_EQ(accepted[0].queryIdx, 5);
    EXPECT_EQ(&accepted, &filter.accepted());
}

TEST_F(CorrespondenceFilterTest, EmptyInputYieldsNothing) {
    EXPECT_TRUE(filter.filter(CandidateMatches{}).empty());
}

TEST_F(CorrespondenceFilterTest, InvalidThresholdsThrow) {
    EXPECT_THROW(CorrespondenceFilter(0.0f), std::invalid_argument);
    EXPECT_THROW(CorrespondenceFilter(1.5f), std::invalid_argument);
    EXPECT_THROW(filter.setRatioThreshold(-0.2f), std::invalid_argument);
    EXPECT_NO_THROW(filter.setRatioThreshold(1.0f));
    EXPECT_FLOAT_EQ(filter.getRatioThreshold(), 1.0f);
}
