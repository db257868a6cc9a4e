#pragma once

#include "src/interfaces/IFeatureExtractor.hpp"
#include <opencv2/features2d.hpp>

namespace target_finder {

/**
 * @brief Shared detectAndCompute() for extractors backed by a cv::Feature2D
 *
 * Colour input is converted to grayscale before detection. Subclasses only
 * construct the underlying OpenCV algorithm.
 */
class OpenCVFeatureExtractor : public IFeatureExtractor {
public:
    FeatureSet detectAndCompute(const cv::Mat& image) override;

protected:
    explicit OpenCVFeatureExtractor(cv::Ptr<cv::Feature2D> detector);

    cv::Ptr<cv::Feature2D> detector_;
};

} // namespace target_finder
