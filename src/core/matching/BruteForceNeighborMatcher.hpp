#pragma once

#include "src/interfaces/INeighborMatcher.hpp"
#include <opencv2/features2d.hpp>

namespace target_finder::matching {

/**
 * @brief Exact kNN search with cv::BFMatcher
 *
 * Defaults to NORM_HAMMING for binary descriptors such as ORB. Cross-check is
 * always off because it cannot be combined with k > 1.
 */
class BruteForceNeighborMatcher : public INeighborMatcher {
public:
    explicit BruteForceNeighborMatcher(int normType = cv::NORM_HAMMING);

    CandidateMatches knnMatch(
        const cv::Mat& queryDescriptors,
        const cv::Mat& trainDescriptors,
        int k = 2
    ) override;

    std::string name() const override { return "BruteForce"; }
    NeighborSearch type() const override { return NeighborSearch::BRUTE_FORCE_HAMMING; }

    int normType() const { return normType_; }

private:
    int normType_;
    cv::BFMatcher matcher_;
};

} // namespace target_finder::matching
