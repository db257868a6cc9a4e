#pragma once

#include "target_finder/types.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace target_finder {

    /**
     * @brief Interface for anything that produces scene frames
     */
    class IFrameSource {
    public:
        virtual ~IFrameSource() = default;

        /**
         * @brief Fetch the next frame, blocking until one is available
         * @param frame Receives the frame on success
         * @return false at end of stream
         */
        virtual bool next(cv::Mat& frame) = 0;

        /**
         * @brief Streaming sources are processed on a frame schedule; static
         *        sources are processed once and then wait for acknowledgement
         */
        virtual bool isStreaming() const = 0;

        virtual SourceKind kind() const = 0;

        virtual std::string describe() const = 0;
    };

} // namespace target_finder
