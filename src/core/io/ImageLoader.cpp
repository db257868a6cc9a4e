#include "ImageLoader.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <filesystem>
#include <stdexcept>

namespace target_finder::io {

cv::Mat loadImage(const std::string& path, bool grayscale) {
    if (path.empty()) {
        throw std::runtime_error("No image path given");
    }
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Unable to open file \"" + path + "\": no such file");
    }

    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw std::runtime_error("Unable to open file \"" + path + "\"");
    }

    if (grayscale) {
        cv::Mat gray;
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
        return gray;
    }
    return image;
}

cv::Mat scaleImage(const cv::Mat& image, double scale) {
    if (scale <= 0.0) {
        throw std::invalid_argument("Scale factor must be positive, got: " + std::to_string(scale));
    }
    if (scale == 1.0 || image.empty()) {
        return image;
    }

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(), scale, scale,
               scale < 1.0 ? cv::INTER_AREA : cv::INTER_LINEAR);
    return resized;
}

} // namespace target_finder::io
