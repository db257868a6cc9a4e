#pragma once

#include "PipelineState.hpp"
#include <opencv2/core.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace target_finder::pipeline {

/**
 * @brief Snapshot of one reporting interval
 *
 * "Potential" frame rate is how fast the loop could run if only the timed
 * processing and display stages counted, i.e. ignoring camera I/O.
 */
struct PipelineReport {
    struct StageSummary {
        std::string name;
        double mean_ms = 0.0;
    };

    double fps = 0.0;
    std::vector<StageSummary> stages;
    size_t correspondenceCount = 0;
    cv::Size frameSize;
    double potentialFps = 0.0;
    cv::Mat transform;               ///< empty unless a transform was produced this interval

    /**
     * @brief Summarize the state's current interval
     * @param elapsedNs Wall time covered by the interval
     */
    static PipelineReport capture(const PipelineState& state, int64_t elapsedNs);

    /**
     * @brief frames * 1e9 / elapsedNs, or 0 when no time has elapsed
     */
    static double instantaneousFps(uint64_t frames, int64_t elapsedNs);

    /**
     * @brief 1e9 / (sum of stage means in ns), or 0 when nothing was timed
     */
    static double theoreticalMaxFps(const statistics::StatisticsSet& stageTimings);

    /**
     * @brief Summary line followed by three matrix rows when a transform is present
     */
    std::vector<std::string> lines() const;

    std::string toString() const;
};

} // namespace target_finder::pipeline
