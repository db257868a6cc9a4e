#pragma once

#include <opencv2/core.hpp>
#include <vector>

namespace target_finder {

    /**
     * @brief Interface for robust planar transform estimation
     */
    class ITransformSolver {
    public:
        virtual ~ITransformSolver() = default;

        /**
         * @brief Estimate the transform mapping sourcePoints onto targetPoints
         * @param sourcePoints Points in reference-image coordinates
         * @param targetPoints Points in scene coordinates, same length and order
         * @return 3x3 CV_64F matrix, or an empty matrix when no transform was found
         */
        virtual cv::Mat estimate(
            const std::vector<cv::Point2f>& sourcePoints,
            const std::vector<cv::Point2f>& targetPoints
        ) = 0;
    };

} // namespace target_finder
