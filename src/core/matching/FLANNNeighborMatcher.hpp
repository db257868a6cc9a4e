#pragma once

#include "src/interfaces/INeighborMatcher.hpp"
#include <opencv2/flann.hpp>
#include <opencv2/features2d.hpp>

namespace target_finder::matching {

/**
 * @brief Approximate kNN search over float descriptors (SIFT, SURF)
 *
 * Wraps cv::FlannBasedMatcher with randomized kd-trees. Descriptors that are
 * not CV_32F are converted before the search, since the kd-tree index only
 * accepts float data.
 */
class FLANNNeighborMatcher : public INeighborMatcher {
public:
    /**
     * @param trees Number of randomized kd-trees (default: 5)
     * @param checks Leaf checks per search (default: 50)
     */
    explicit FLANNNeighborMatcher(int trees = 5, int checks = 50);

    CandidateMatches knnMatch(
        const cv::Mat& queryDescriptors,
        const cv::Mat& trainDescriptors,
        int k = 2
    ) override;

    std::string name() const override { return "FLANN"; }
    NeighborSearch type() const override { return NeighborSearch::FLANN_KDTREE; }

private:
    cv::Ptr<cv::FlannBasedMatcher> matcher_;
};

} // namespace target_finder::matching
