#pragma once

#include "target_finder/types.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace target_finder::matching {

/**
 * @brief Lowe's ratio test over k-nearest-neighbour candidate lists
 *
 * A query feature is kept only when its best candidate is clearly closer
 * than its second-best one:
 *
 *     best.distance < ratioThreshold * second.distance
 *
 * Each candidate list is expected to hold exactly two entries in ascending
 * distance order. Lists with fewer entries cannot be tested and are skipped.
 *
 * The accepted matches keep the input order and are not made one-to-one:
 * several query features may end up pointing at the same train feature.
 *
 * References:
 * - Lowe, D.G. (2004). "Distinctive Image Features from Scale-Invariant Keypoints"
 */
class CorrespondenceFilter {
public:
    static constexpr float kDefaultRatioThreshold = 0.7f;

    /**
     * @param ratioThreshold Acceptance ratio in (0, 1]
     * @throws std::invalid_argument if the ratio is outside (0, 1]
     */
    explicit CorrespondenceFilter(float ratioThreshold = kDefaultRatioThreshold);

    /**
     * @brief Apply the ratio test to one frame's candidate lists
     *
     * The previous call's result is discarded first, so nothing from an
     * earlier frame survives into the returned set.
     *
     * @return Reference to the accepted matches, valid until the next call
     */
    const Correspondences& filter(const CandidateMatches& candidates);

    const Correspondences& accepted() const { return accepted_; }

    float getRatioThreshold() const { return ratioThreshold_; }

    /**
     * @throws std::invalid_argument if the ratio is outside (0, 1]
     */
    void setRatioThreshold(float threshold);

    /**
     * @brief Ratio test for a single candidate list
     */
    static bool passesRatioTest(const std::vector<cv::DMatch>& candidates, float ratioThreshold);

private:
    float ratioThreshold_;
    Correspondences accepted_;  ///< scratch buffer, cleared on every filter() call
};

} // namespace target_finder::matching
