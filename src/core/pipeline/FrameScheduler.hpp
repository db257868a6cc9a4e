#pragma once

#include "PipelineReport.hpp"
#include "PipelineState.hpp"
#include "src/core/localization/Localizer.hpp"
#include "src/core/matching/CorrespondenceFilter.hpp"
#include "src/interfaces/IFeatureExtractor.hpp"
#include "src/interfaces/IFrameSource.hpp"
#include "src/interfaces/INeighborMatcher.hpp"
#include "src/interfaces/IRenderer.hpp"
#include "src/interfaces/ITransformSolver.hpp"
#include <cstdint>
#include <functional>

namespace target_finder::pipeline {

/// Monotonic time source in nanoseconds
using NanoClock = std::function<int64_t()>;

NanoClock steadyNanoClock();

/// Receives each report after it has been logged
using ReportSink = std::function<void(const PipelineReport&)>;

/**
 * @brief The object being searched for
 */
struct ReferenceTarget {
    cv::Mat image;
    FeatureSet features;
    cv::Mat overlay;   ///< optional, already sized to the reference image
};

struct SchedulerOptions {
    int processEvery = 1;                    ///< streaming: expensive stages on frames N, 2N, ...
    size_t minSceneKeypoints = 4;            ///< matching needs strictly more scene keypoints
    int minMatches = localization::Localizer::kDefaultMinMatches;
    float ratioThreshold = matching::CorrespondenceFilter::kDefaultRatioThreshold;
    double inputScale = 1.0;
    int64_t reportIntervalNs = 1000000000;
    int keyWaitMs = 30;
};

/**
 * @brief What happened during one loop iteration
 */
struct FrameOutcome {
    uint64_t frameNumber = 0;
    bool acquired = false;
    bool processed = false;               ///< detection ran this frame
    bool matched = false;                 ///< kNN + ratio test ran this frame
    bool localizationAttempted = false;
    bool haveTransform = false;           ///< includes a carried-forward transform
    bool reported = false;
    bool stop = false;
};

/**
 * @brief Single-threaded per-frame control loop
 *
 * Each iteration acquires a frame, optionally resizes it, runs the expensive
 * detect/match/localize stages when scheduled, renders, emits a report when
 * the interval has elapsed and finally checks for a stop request.
 *
 * Streaming sources run the expensive stages only on frames whose number is
 * a multiple of processEvery; other frames reuse the last results. Static
 * sources always run them and stop after one acknowledgement.
 */
class FrameScheduler {
public:
    /**
     * All references must outlive the scheduler.
     *
     * @throws std::invalid_argument for processEvery < 1, a non-positive
     *         scale or report interval, or a reference without descriptors
     */
    FrameScheduler(
        IFrameSource& source,
        IFeatureExtractor& extractor,
        INeighborMatcher& matcher,
        ITransformSolver& solver,
        IRenderer& renderer,
        const ReferenceTarget& target,
        SchedulerOptions options = {},
        NanoClock clock = steadyNanoClock()
    );

    /**
     * @brief Run one iteration against the given state
     */
    FrameOutcome step(PipelineState& state);

    /**
     * @brief Iterate until a stop request or end of stream
     * @return Number of frames acquired
     */
    uint64_t run(PipelineState& state);

    /**
     * @brief Whether frame number frameNumber runs the expensive stages
     */
    bool shouldProcess(uint64_t frameNumber) const;

    void setReportSink(ReportSink sink) { reportSink_ = std::move(sink); }

    const SchedulerOptions& options() const { return options_; }

private:
    void runExpensiveStages(const cv::Mat& frame, PipelineState& state, FrameOutcome& outcome);
    void renderFrame(const cv::Mat& frame, PipelineState& state);
    bool maybeReport(PipelineState& state);
    void emitReport(const PipelineReport& report);

    IFrameSource& source_;
    IFeatureExtractor& extractor_;
    INeighborMatcher& matcher_;
    IRenderer& renderer_;
    const ReferenceTarget& target_;
    SchedulerOptions options_;
    NanoClock clock_;

    matching::CorrespondenceFilter filter_;
    localization::Localizer localizer_;
    ReportSink reportSink_;
};

} // namespace target_finder::pipeline
