#pragma once

#include "OpenCVFeatureExtractor.hpp"

namespace target_finder {

/**
 * @brief SURF keypoints and descriptors (cv::xfeatures2d::SURF)
 *
 * Needs OpenCV built with opencv_contrib and OPENCV_ENABLE_NONFREE; otherwise
 * construction throws.
 */
class SURFFeatureExtractor : public OpenCVFeatureExtractor {
public:
    /**
     * @param hessian_threshold Minimum Hessian response for a keypoint
     * @throws std::runtime_error if SURF is unavailable in this OpenCV build
     */
    explicit SURFFeatureExtractor(
        double hessian_threshold = 400.0,
        int num_octaves = 4,
        int num_octave_layers = 3
    );

    std::string name() const override { return "SURF"; }
    FeatureAlgorithm type() const override { return FeatureAlgorithm::SURF; }

    double hessianThreshold() const { return hessian_threshold_; }

private:
    double hessian_threshold_;
};

} // namespace target_finder
