#include "OpenCVFeatureExtractor.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <utility>

namespace target_finder {

OpenCVFeatureExtractor::OpenCVFeatureExtractor(cv::Ptr<cv::Feature2D> detector)
    : detector_(std::move(detector)) {
    if (!detector_) {
        throw std::invalid_argument("Feature extractor requires a detector instance");
    }
}

FeatureSet OpenCVFeatureExtractor::detectAndCompute(const cv::Mat& image) {
    FeatureSet features;
    if (image.empty()) {
        return features;
    }

    cv::Mat gray_image;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray_image, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray_image, cv::COLOR_BGRA2GRAY);
    } else {
        gray_image = image;
    }

    detector_->detectAndCompute(gray_image, cv::noArray(), features.keypoints, features.descriptors);
    return features;
}

} // namespace target_finder
