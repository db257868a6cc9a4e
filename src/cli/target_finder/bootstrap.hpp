#pragma once

#include "src/core/config/RecognitionConfig.hpp"
#include "src/core/pipeline/FrameScheduler.hpp"
#include "src/interfaces/IFeatureExtractor.hpp"
#include "src/interfaces/IFrameSource.hpp"
#include <memory>

namespace target_finder::cli::target_finder_bootstrap {

// A homography needs at least 4 reference keypoints (3 of them non-colinear).
constexpr size_t kMinReferenceKeypoints = 4;

// Load the reference image, compute its features and load the optional
// superpose image resized to the reference dimensions.
// Throws std::runtime_error if an image cannot be read or the reference
// yields too few keypoints.
pipeline::ReferenceTarget loadReferenceTarget(const config::RecognitionConfig& config,
                                              IFeatureExtractor& extractor);

// Webcam or static image source, as selected by config.input.path.
std::unique_ptr<IFrameSource> openFrameSource(const config::RecognitionConfig& config);

pipeline::SchedulerOptions makeSchedulerOptions(const config::RecognitionConfig& config);

} // namespace target_finder::cli::target_finder_bootstrap
