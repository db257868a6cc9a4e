#pragma once

#include "target_finder/types.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace target_finder {

    /**
     * @brief Interface for k-nearest-neighbour descriptor search
     */
    class INeighborMatcher {
    public:
        virtual ~INeighborMatcher() = default;

        /**
         * @brief Find the k best train descriptors for every query descriptor
         * @param queryDescriptors One descriptor per row
         * @param trainDescriptors One descriptor per row
         * @param k Number of ranked candidates per query row
         * @return One list per query row, ascending by distance
         */
        virtual CandidateMatches knnMatch(
            const cv::Mat& queryDescriptors,
            const cv::Mat& trainDescriptors,
            int k = 2
        ) = 0;

        virtual std::string name() const = 0;

        virtual NeighborSearch type() const = 0;
    };

} // namespace target_finder
