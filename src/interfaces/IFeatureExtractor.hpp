#pragma once

#include "target_finder/types.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace target_finder {

    /**
     * @brief Interface for combined keypoint detection and description
     *
     * Implementations wrap one OpenCV Feature2D family. An image with no
     * detectable features yields an empty FeatureSet, which is not an error.
     */
    class IFeatureExtractor {
    public:
        virtual ~IFeatureExtractor() = default;

        /**
         * @brief Detect keypoints and compute their descriptors
         * @param image Input image (grayscale or BGR)
         * @return Keypoints with matching descriptor rows
         */
        virtual FeatureSet detectAndCompute(const cv::Mat& image) = 0;

        /**
         * @brief Human-readable family name (e.g. "SIFT", "ORB")
         */
        virtual std::string name() const = 0;

        virtual FeatureAlgorithm type() const = 0;
    };

} // namespace target_finder
