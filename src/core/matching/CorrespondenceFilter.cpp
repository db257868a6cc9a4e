#include "CorrespondenceFilter.hpp"
#include <stdexcept>
#include <string>

namespace target_finder::matching {

namespace {

void validateRatio(float threshold) {
    if (!(threshold > 0.0f && threshold <= 1.0f)) {
        throw std::invalid_argument("Ratio threshold must be in (0, 1], got: " + std::to_string(threshold));
    }
}

}

CorrespondenceFilter::CorrespondenceFilter(float ratioThreshold)
    : ratioThreshold_(ratioThreshold) {
    validateRatio(ratioThreshold);
}

void CorrespondenceFilter::setRatioThreshold(float threshold) {
    validateRatio(threshold);
    ratioThreshold_ = threshold;
}

bool CorrespondenceFilter::passesRatioTest(const std::vector<cv::DMatch>& candidates, float ratioThreshold) {
    if (candidates.size() < 2) {
        return false;
    }
    return candidates[0].distance < ratioThreshold * candidates[1].distance;
}

const Correspondences& CorrespondenceFilter::filter(const CandidateMatches& candidates) {
    accepted_.clear();
    accepted_.reserve(candidates.size() / 2);

    for (const auto& candidateList : candidates) {
        if (passesRatioTest(candidateList, ratioThreshold_)) {
            accepted_.push_back(candidateList[0]);
        }
    }

    return accepted_;
}

} // namespace target_finder::matching
