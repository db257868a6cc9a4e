#pragma once

#include "OpenCVFeatureExtractor.hpp"

namespace target_finder {

/**
 * @brief ORB (Oriented FAST and Rotated BRIEF) with binary descriptors
 *
 * Patent-free and fast; pair it with a Hamming-distance matcher.
 */
class ORBFeatureExtractor : public OpenCVFeatureExtractor {
public:
    /**
     * @param num_features Maximum number of features to retain
     * @param scale_factor Pyramid decimation ratio
     * @param num_levels Number of pyramid levels
     */
    explicit ORBFeatureExtractor(
        int num_features = 500,
        float scale_factor = 1.2f,
        int num_levels = 8
    );

    std::string name() const override { return "ORB"; }
    FeatureAlgorithm type() const override { return FeatureAlgorithm::ORB; }

    int numFeatures() const { return num_features_; }

private:
    int num_features_;
};

} // namespace target_finder
