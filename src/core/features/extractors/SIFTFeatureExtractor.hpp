#pragma once

#include "OpenCVFeatureExtractor.hpp"

namespace target_finder {

/**
 * @brief SIFT keypoints and 128-float descriptors (cv::SIFT)
 */
class SIFTFeatureExtractor : public OpenCVFeatureExtractor {
public:
    explicit SIFTFeatureExtractor(
        int num_features = 0,
        int num_octave_layers = 3,
        double contrast_threshold = 0.04,
        double edge_threshold = 10.0,
        double sigma = 1.6
    );

    std::string name() const override { return "SIFT"; }
    FeatureAlgorithm type() const override { return FeatureAlgorithm::SIFT; }
};

} // namespace target_finder
