#include "ORBFeatureExtractor.hpp"

namespace target_finder {

ORBFeatureExtractor::ORBFeatureExtractor(
    int num_features,
    float scale_factor,
    int num_levels
) : OpenCVFeatureExtractor(cv::ORB::create(num_features, scale_factor, num_levels)),
    num_features_(num_features) {
}

} // namespace target_finder
