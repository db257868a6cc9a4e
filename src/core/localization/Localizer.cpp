#include "Localizer.hpp"
#include <stdexcept>
#include <string>

namespace target_finder::localization {

Localizer::Localizer(ITransformSolver& solver, int minMatches)
    : solver_(solver), minMatches_(minMatches) {
    if (minMatches < 0) {
        throw std::invalid_argument("Minimum match count must be non-negative, got: " +
                                    std::to_string(minMatches));
    }
}

bool Localizer::shouldAttempt(size_t correspondenceCount) const {
    return correspondenceCount > static_cast<size_t>(minMatches_) &&
           correspondenceCount >= kMinimumTransformPoints;
}

void Localizer::collectPoints(
    const FeatureSet& reference,
    const FeatureSet& scene,
    const Correspondences& correspondences,
    std::vector<cv::Point2f>& referencePoints,
    std::vector<cv::Point2f>& scenePoints
) {
    referencePoints.clear();
    scenePoints.clear();
    referencePoints.reserve(correspondences.size());
    scenePoints.reserve(correspondences.size());

    for (const auto& match : correspondences) {
        if (match.queryIdx < 0 || match.queryIdx >= static_cast<int>(reference.keypoints.size()) ||
            match.trainIdx < 0 || match.trainIdx >= static_cast<int>(scene.keypoints.size())) {
            throw std::out_of_range("Correspondence (" + std::to_string(match.queryIdx) + ", " +
                                    std::to_string(match.trainIdx) + ") is outside the feature sets");
        }
        referencePoints.push_back(reference.keypoints[match.queryIdx].pt);
        scenePoints.push_back(scene.keypoints[match.trainIdx].pt);
    }
}

LocalizationResult Localizer::localize(
    const FeatureSet& reference,
    const FeatureSet& scene,
    const Correspondences& correspondences
) const {
    LocalizationResult result;
    if (!shouldAttempt(correspondences.size())) {
        return result;
    }

    std::vector<cv::Point2f> referencePoints;
    std::vector<cv::Point2f> scenePoints;
    collectPoints(reference, scene, correspondences, referencePoints, scenePoints);

    result.attempted = true;
    result.transform = solver_.estimate(referencePoints, scenePoints);
    result.haveTransform = !result.transform.empty();
    return result;
}

} // namespace target_finder::localization
