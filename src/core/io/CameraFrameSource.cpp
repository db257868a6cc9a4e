#include "CameraFrameSource.hpp"
#include "target_finder/logging.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>

namespace target_finder::io {

CameraFrameSource::CameraFrameSource(int deviceIndex, bool grayscale)
    : deviceIndex_(deviceIndex), grayscale_(grayscale), capture_(deviceIndex) {
    if (!capture_.isOpened()) {
        throw std::runtime_error("Unable to open capture device " + std::to_string(deviceIndex));
    }
    LOG_INFO("Opened capture device " + std::to_string(deviceIndex));
}

bool CameraFrameSource::next(cv::Mat& frame) {
    cv::Mat captured;
    if (!capture_.read(captured) || captured.empty()) {
        LOG_WARNING("Capture device " + std::to_string(deviceIndex_) + " returned no frame");
        return false;
    }

    if (grayscale_ && captured.channels() == 3) {
        cv::cvtColor(captured, frame, cv::COLOR_BGR2GRAY);
    } else {
        frame = captured;
    }
    return true;
}

std::string CameraFrameSource::describe() const {
    return "webcam " + std::to_string(deviceIndex_);
}

} // namespace target_finder::io
