#pragma once

#include "src/interfaces/IFrameSource.hpp"
#include <opencv2/videoio.hpp>

namespace target_finder::io {

/**
 * @brief Live frames from a capture device (cv::VideoCapture)
 */
class CameraFrameSource : public IFrameSource {
public:
    /**
     * @param deviceIndex Capture device index (0 = default camera)
     * @param grayscale Deliver single-channel frames
     * @throws std::runtime_error if the device cannot be opened
     */
    explicit CameraFrameSource(int deviceIndex = 0, bool grayscale = false);

    bool next(cv::Mat& frame) override;

    bool isStreaming() const override { return true; }
    SourceKind kind() const override { return SourceKind::WEBCAM; }
    std::string describe() const override;

private:
    int deviceIndex_;
    bool grayscale_;
    cv::VideoCapture capture_;
};

} // namespace target_finder::io
