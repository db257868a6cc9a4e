#include "FLANNNeighborMatcher.hpp"

namespace target_finder::matching {

namespace {

cv::Mat asFloat(const cv::Mat& descriptors) {
    if (descriptors.type() == CV_32F) {
        return descriptors;
    }
    cv::Mat converted;
    descriptors.convertTo(converted, CV_32F);
    return converted;
}

}

FLANNNeighborMatcher::FLANNNeighborMatcher(int trees, int checks) {
    auto indexParams = cv::makePtr<cv::flann::KDTreeIndexParams>(trees);
    auto searchParams = cv::makePtr<cv::flann::SearchParams>(checks);
    matcher_ = cv::makePtr<cv::FlannBasedMatcher>(indexParams, searchParams);
}

CandidateMatches FLANNNeighborMatcher::knnMatch(
    const cv::Mat& queryDescriptors,
    const cv::Mat& trainDescriptors,
    int k
) {
    CandidateMatches candidates;
    if (queryDescriptors.empty() || trainDescriptors.empty()) {
        return candidates;
    }

    matcher_->knnMatch(asFloat(queryDescriptors), asFloat(trainDescriptors), candidates, k);
    return candidates;
}

} // namespace target_finder::matching
