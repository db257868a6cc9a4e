#include "SIFTFeatureExtractor.hpp"

namespace target_finder {

SIFTFeatureExtractor::SIFTFeatureExtractor(
    int num_features,
    int num_octave_layers,
    double contrast_threshold,
    double edge_threshold,
    double sigma
) : OpenCVFeatureExtractor(cv::SIFT::create(
        num_features,
        num_octave_layers,
        contrast_threshold,
        edge_threshold,
        sigma)) {
}

} // namespace target_finder
