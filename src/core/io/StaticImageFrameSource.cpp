#include "StaticImageFrameSource.hpp"
#include "ImageLoader.hpp"
#include "target_finder/logging.hpp"
#include <stdexcept>
#include <utility>

namespace target_finder::io {

StaticImageFrameSource::StaticImageFrameSource(std::string path, bool grayscale)
    : path_(std::move(path)), grayscale_(grayscale) {
    // Fail at startup rather than on the first frame
    loadImage(path_, grayscale_);
}

bool StaticImageFrameSource::next(cv::Mat& frame) {
    try {
        frame = loadImage(path_, grayscale_);
    } catch (const std::runtime_error& e) {
        LOG_ERROR(e.what());
        return false;
    }
    return true;
}

} // namespace target_finder::io
