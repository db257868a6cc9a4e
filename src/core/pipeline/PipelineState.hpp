#pragma once

#include "src/core/statistics/StatisticsSet.hpp"
#include "target_finder/types.hpp"
#include <opencv2/core.hpp>
#include <cstdint>

namespace target_finder::pipeline {

/**
 * @brief Timed stages, in report order
 */
enum class Stage : size_t {
    RESIZE = 0,
    DETECT,
    MATCH,
    HOMOGRAPHY,
    DRAW
};

std::string toString(Stage stage);

/**
 * @brief Everything the recognition loop mutates between iterations
 *
 * Owned by the caller of FrameScheduler::step() and passed to every
 * iteration. The scene features, correspondences and transform are
 * carry-forward results: they survive frames that skip the expensive stages
 * and are only replaced by the next scheduled pass.
 */
struct PipelineState {
    PipelineState();

    uint64_t frameNumber = 0;        ///< frames acquired since start, first frame is 1
    uint64_t intervalFrames = 0;     ///< frames since the last report
    int64_t intervalStartNs = 0;
    bool intervalStarted = false;

    statistics::StatisticsSet stageTimings;  ///< nanoseconds per stage

    // Carry-forward results of the most recent scheduled pass
    FeatureSet sceneFeatures;
    Correspondences correspondences;
    cv::Mat transform;
    bool haveTransform = false;

    bool transformProducedThisInterval = false;
    cv::Size frameSize;

    size_t stageIndex(Stage stage) const { return static_cast<size_t>(stage); }

    void addStageSample(Stage stage, double nanoseconds);

    /**
     * @brief Drop the previous pass's results before a new pass runs
     */
    void clearPassResults();

    /**
     * @brief Start a new reporting interval at nowNs, clearing all stage timings
     */
    void resetInterval(int64_t nowNs);
};

} // namespace target_finder::pipeline
