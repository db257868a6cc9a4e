#pragma once

#include "src/interfaces/ITransformSolver.hpp"

namespace target_finder::localization {

/**
 * @brief RANSAC homography fit via cv::findHomography
 *
 * Returns an empty matrix for fewer than four point pairs, mismatched
 * input lengths, or when OpenCV finds no consistent model.
 */
class HomographySolver : public ITransformSolver {
public:
    static constexpr size_t kMinimumPoints = 4;

    /**
     * @param reprojectionThreshold Max reprojection error (px) for an inlier
     */
    explicit HomographySolver(double reprojectionThreshold = 3.0);

    cv::Mat estimate(
        const std::vector<cv::Point2f>& sourcePoints,
        const std::vector<cv::Point2f>& targetPoints
    ) override;

    double reprojectionThreshold() const { return reprojectionThreshold_; }

    /**
     * @brief Inlier count of the most recent successful estimate
     */
    int lastInlierCount() const { return lastInlierCount_; }

private:
    double reprojectionThreshold_;
    int lastInlierCount_ = 0;
};

} // namespace target_finder::localization
