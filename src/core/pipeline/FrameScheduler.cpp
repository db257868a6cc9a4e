#include "FrameScheduler.hpp"
#include "src/core/io/ImageLoader.hpp"
#include "target_finder/logging.hpp"
#include <chrono>
#include <stdexcept>
#include <utility>

namespace target_finder::pipeline {

NanoClock steadyNanoClock() {
    return [] {
        return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count());
    };
}

FrameScheduler::FrameScheduler(
    IFrameSource& source,
    IFeatureExtractor& extractor,
    INeighborMatcher& matcher,
    ITransformSolver& solver,
    IRenderer& renderer,
    const ReferenceTarget& target,
    SchedulerOptions options,
    NanoClock clock
) : source_(source),
    extractor_(extractor),
    matcher_(matcher),
    renderer_(renderer),
    target_(target),
    options_(options),
    clock_(std::move(clock)),
    filter_(options.ratioThreshold),
    localizer_(solver, options.minMatches) {
    if (options_.processEvery < 1) {
        throw std::invalid_argument("Frame interval must be at least 1, got: " +
                                    std::to_string(options_.processEvery));
    }
    if (options_.inputScale <= 0.0) {
        throw std::invalid_argument("Input scale must be positive");
    }
    if (options_.reportIntervalNs <= 0) {
        throw std::invalid_argument("Report interval must be positive");
    }
    if (target_.image.empty() || target_.features.descriptors.empty()) {
        throw std::invalid_argument("Reference target has no image or descriptors");
    }
    if (!clock_) {
        clock_ = steadyNanoClock();
    }
}

bool FrameScheduler::shouldProcess(uint64_t frameNumber) const {
    if (!source_.isStreaming()) {
        return true;
    }
    return frameNumber % static_cast<uint64_t>(options_.processEvery) == 0;
}

FrameOutcome FrameScheduler::step(PipelineState& state) {
    if (!state.intervalStarted) {
        state.resetInterval(clock_());
    }

    FrameOutcome outcome;
    cv::Mat frame;
    if (!source_.next(frame)) {
        LOG_INFO("End of input from " + source_.describe());
        outcome.frameNumber = state.frameNumber;
        outcome.stop = true;
        return outcome;
    }
    ++state.frameNumber;
    ++state.intervalFrames;
    outcome.frameNumber = state.frameNumber;
    outcome.acquired = true;

    if (options_.inputScale != 1.0) {
        const int64_t t1 = clock_();
        frame = io::scaleImage(frame, options_.inputScale);
        state.addStageSample(Stage::RESIZE, static_cast<double>(clock_() - t1));
    }
    state.frameSize = frame.size();

    if (shouldProcess(state.frameNumber)) {
        runExpensiveStages(frame, state, outcome);
    }
    // Carry-forward: on skipped frames the last pass's transform is still drawn
    outcome.haveTransform = state.haveTransform;

    renderFrame(frame, state);

    outcome.reported = maybeReport(state);

    if (source_.isStreaming()) {
        outcome.stop = renderer_.waitKey(options_.keyWaitMs) >= 0;
    } else {
        renderer_.waitKey(0);
        outcome.stop = true;
    }
    return outcome;
}

uint64_t FrameScheduler::run(PipelineState& state) {
    uint64_t acquired = 0;
    for (;;) {
        const FrameOutcome outcome = step(state);
        if (outcome.acquired) {
            ++acquired;
        }
        if (outcome.stop) {
            break;
        }
    }
    return acquired;
}

void FrameScheduler::runExpensiveStages(const cv::Mat& frame, PipelineState& state, FrameOutcome& outcome) {
    state.clearPassResults();

    int64_t t1 = clock_();
    state.sceneFeatures = extractor_.detectAndCompute(frame);
    state.addStageSample(Stage::DETECT, static_cast<double>(clock_() - t1));
    outcome.processed = true;

    // A covered camera can yield no keypoints at all; a homography needs
    // at least four, three of them non-colinear
    if (state.sceneFeatures.size() <= options_.minSceneKeypoints) {
        LOG_DEBUG("Frame " + std::to_string(state.frameNumber) + ": only " +
                  std::to_string(state.sceneFeatures.size()) + " keypoints, skipping matching");
        return;
    }

    t1 = clock_();
    const CandidateMatches candidates =
        matcher_.knnMatch(target_.features.descriptors, state.sceneFeatures.descriptors, 2);
    state.correspondences = filter_.filter(candidates);
    state.addStageSample(Stage::MATCH, static_cast<double>(clock_() - t1));
    outcome.matched = true;

    if (!localizer_.shouldAttempt(state.correspondences.size())) {
        return;
    }

    t1 = clock_();
    localization::LocalizationResult result =
        localizer_.localize(target_.features, state.sceneFeatures, state.correspondences);
    state.addStageSample(Stage::HOMOGRAPHY, static_cast<double>(clock_() - t1));

    outcome.localizationAttempted = result.attempted;
    state.haveTransform = result.haveTransform;
    state.transform = result.transform;
    if (state.haveTransform) {
        state.transformProducedThisInterval = true;
    }
}

void FrameScheduler::renderFrame(const cv::Mat& frame, PipelineState& state) {
    RenderRequest request;
    request.reference = &target_.image;
    request.referenceFeatures = &target_.features;
    request.scene = &frame;
    request.sceneFeatures = &state.sceneFeatures;
    request.correspondences = &state.correspondences;
    request.transform = state.haveTransform ? &state.transform : nullptr;
    request.overlay = target_.overlay.empty() ? nullptr : &target_.overlay;

    const int64_t t1 = clock_();
    renderer_.render(request);
    state.addStageSample(Stage::DRAW, static_cast<double>(clock_() - t1));
}

bool FrameScheduler::maybeReport(PipelineState& state) {
    const int64_t now = clock_();
    const int64_t elapsed = now - state.intervalStartNs;
    if (elapsed < options_.reportIntervalNs) {
        return false;
    }

    emitReport(PipelineReport::capture(state, elapsed));
    state.resetInterval(now);
    return true;
}

void FrameScheduler::emitReport(const PipelineReport& report) {
    for (const auto& line : report.lines()) {
        LOG_INFO(line);
    }
    if (reportSink_) {
        reportSink_(report);
    }
}

} // namespace target_finder::pipeline
