#include "PipelineState.hpp"

namespace target_finder::pipeline {

std::string toString(Stage stage) {
    switch (stage) {
        case Stage::RESIZE: return "resize";
        case Stage::DETECT: return "detect";
        case Stage::MATCH: return "match";
        case Stage::HOMOGRAPHY: return "homography";
        case Stage::DRAW: return "draw";
        default: return "unknown";
    }
}

PipelineState::PipelineState() {
    // Registration order must follow the Stage enum so indices line up
    for (Stage stage : {Stage::RESIZE, Stage::DETECT, Stage::MATCH, Stage::HOMOGRAPHY, Stage::DRAW}) {
        stageTimings.addName(toString(stage));
    }
}

void PipelineState::addStageSample(Stage stage, double nanoseconds) {
    stageTimings.addSample(stageIndex(stage), nanoseconds);
}

void PipelineState::clearPassResults() {
    sceneFeatures = FeatureSet();
    correspondences.clear();
    transform.release();
    haveTransform = false;
}

void PipelineState::resetInterval(int64_t nowNs) {
    intervalStartNs = nowNs;
    intervalStarted = true;
    intervalFrames = 0;
    transformProducedThisInterval = false;
    stageTimings.clear();
}

} // namespace target_finder::pipeline
