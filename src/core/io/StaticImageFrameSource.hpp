#pragma once

#include "src/interfaces/IFrameSource.hpp"

namespace target_finder::io {

/**
 * @brief Serves the same image file on every call
 *
 * The file is re-read on each next(), matching a source that is reloaded
 * every iteration. A file that disappears between calls ends the stream.
 */
class StaticImageFrameSource : public IFrameSource {
public:
    /**
     * @throws std::runtime_error if the file cannot be read at construction
     */
    explicit StaticImageFrameSource(std::string path, bool grayscale = false);

    bool next(cv::Mat& frame) override;

    bool isStreaming() const override { return false; }
    SourceKind kind() const override { return SourceKind::IMAGE_FILE; }
    std::string describe() const override { return path_; }

private:
    std::string path_;
    bool grayscale_;
};

} // namespace target_finder::io
