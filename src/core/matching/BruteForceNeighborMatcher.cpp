#include "BruteForceNeighborMatcher.hpp"

namespace target_finder::matching {

BruteForceNeighborMatcher::BruteForceNeighborMatcher(int normType)
    : normType_(normType), matcher_(normType, false) {
}

CandidateMatches BruteForceNeighborMatcher::knnMatch(
    const cv::Mat& queryDescriptors,
    const cv::Mat& trainDescriptors,
    int k
) {
    CandidateMatches candidates;
    if (queryDescriptors.empty() || trainDescriptors.empty()) {
        return candidates;
    }

    matcher_.knnMatch(queryDescriptors, trainDescriptors, candidates, k);
    return candidates;
}

} // namespace target_finder::matching
