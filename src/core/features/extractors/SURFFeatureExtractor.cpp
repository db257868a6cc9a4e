#include "SURFFeatureExtractor.hpp"
#include <opencv2/opencv_modules.hpp>
#ifdef HAVE_OPENCV_XFEATURES2D
#include <opencv2/xfeatures2d.hpp>
#endif
#include <stdexcept>
#include <string>

namespace target_finder {

namespace {

cv::Ptr<cv::Feature2D> createSurf(double hessian_threshold, int num_octaves, int num_octave_layers) {
#ifdef HAVE_OPENCV_XFEATURES2D
    try {
        return cv::xfeatures2d::SURF::create(hessian_threshold, num_octaves, num_octave_layers);
    } catch (const cv::Exception& e) {
        throw std::runtime_error(std::string("SURF is unavailable: ") + e.what());
    }
#else
    (void)hessian_threshold;
    (void)num_octaves;
    (void)num_octave_layers;
    throw std::runtime_error("SURF requires OpenCV built with the xfeatures2d contrib module");
#endif
}

}

SURFFeatureExtractor::SURFFeatureExtractor(
    double hessian_threshold,
    int num_octaves,
    int num_octave_layers
) : OpenCVFeatureExtractor(createSurf(hessian_threshold, num_octaves, num_octave_layers)),
    hessian_threshold_(hessian_threshold) {
}

} // namespace target_finder
