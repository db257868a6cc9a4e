#pragma once

#include "src/interfaces/ITransformSolver.hpp"
#include "target_finder/types.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace target_finder::localization {

/**
 * @brief Outcome of one localization attempt
 */
struct LocalizationResult {
    bool attempted = false;      ///< enough correspondences to call the solver
    bool haveTransform = false;
    cv::Mat transform;           ///< 3x3 reference-to-scene mapping, empty when none
};

/**
 * @brief Decides whether a frame's correspondences justify a transform fit
 *
 * The solver is only consulted when the correspondence count is strictly
 * greater than the configured minimum, and never with fewer than the four
 * point pairs a homography needs. Too few correspondences is an ordinary
 * result and leaves haveTransform false.
 */
class Localizer {
public:
    static constexpr int kDefaultMinMatches = 4;
    static constexpr size_t kMinimumTransformPoints = 4;

    /**
     * @param solver Transform estimator; must outlive the Localizer
     * @param minMatches Correspondence count that must be exceeded
     * @throws std::invalid_argument if minMatches is negative
     */
    explicit Localizer(ITransformSolver& solver, int minMatches = kDefaultMinMatches);

    LocalizationResult localize(
        const FeatureSet& reference,
        const FeatureSet& scene,
        const Correspondences& correspondences
    ) const;

    bool shouldAttempt(size_t correspondenceCount) const;

    int minMatches() const { return minMatches_; }

    /**
     * @brief Build index-aligned reference/scene point lists from correspondences
     *
     * queryIdx selects from the reference set, trainIdx from the scene set.
     *
     * @throws std::out_of_range if a correspondence indexes past either set
     */
    static void collectPoints(
        const FeatureSet& reference,
        const FeatureSet& scene,
        const Correspondences& correspondences,
        std::vector<cv::Point2f>& referencePoints,
        std::vector<cv::Point2f>& scenePoints
    );

private:
    ITransformSolver& solver_;
    int minMatches_;
};

} // namespace target_finder::localization
