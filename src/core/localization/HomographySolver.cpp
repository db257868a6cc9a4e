#include "HomographySolver.hpp"
#include "target_finder/logging.hpp"
#include <opencv2/calib3d.hpp>
#include <stdexcept>

namespace target_finder::localization {

HomographySolver::HomographySolver(double reprojectionThreshold)
    : reprojectionThreshold_(reprojectionThreshold) {
    if (reprojectionThreshold <= 0.0) {
        throw std::invalid_argument("RANSAC reprojection threshold must be positive");
    }
}

cv::Mat HomographySolver::estimate(
    const std::vector<cv::Point2f>& sourcePoints,
    const std::vector<cv::Point2f>& targetPoints
) {
    lastInlierCount_ = 0;

    if (sourcePoints.size() != targetPoints.size() || sourcePoints.size() < kMinimumPoints) {
        return cv::Mat();
    }

    std::vector<uchar> inlierMask;
    cv::Mat transform;
    try {
        transform = cv::findHomography(sourcePoints, targetPoints, cv::RANSAC,
                                       reprojectionThreshold_, inlierMask);
    } catch (const cv::Exception& e) {
        // Degenerate point configurations are a per-frame outcome, not a failure
        LOG_DEBUG(std::string("findHomography rejected input: ") + e.what());
        return cv::Mat();
    }

    if (!transform.empty()) {
        lastInlierCount_ = cv::countNonZero(inlierMask);
    }
    return transform;
}

} // namespace target_finder::localization
