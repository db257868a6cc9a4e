#include "PipelineReport.hpp"
#include <iomanip>
#include <sstream>

namespace target_finder::pipeline {

namespace {

constexpr double kNanosecondsPerSecond = 1e9;
constexpr double kNanosecondsPerMillisecond = 1e6;

std::string formatTransformRow(const cv::Mat& transform, int row) {
    std::ostringstream oss;
    oss << "|" << std::fixed << std::showpos << std::setprecision(2);
    for (int col = 0; col < 3; ++col) {
        oss << " " << std::setw(8) << transform.at<double>(row, col);
    }
    oss << " |";
    return oss.str();
}

}

double PipelineReport::instantaneousFps(uint64_t frames, int64_t elapsedNs) {
    if (elapsedNs <= 0) {
        return 0.0;
    }
    return static_cast<double>(frames) * kNanosecondsPerSecond / static_cast<double>(elapsedNs);
}

double PipelineReport::theoreticalMaxFps(const statistics::StatisticsSet& stageTimings) {
    const double total = stageTimings.sumOfMeans();
    if (total <= 0.0) {
        return 0.0;
    }
    return kNanosecondsPerSecond / total;
}

PipelineReport PipelineReport::capture(const PipelineState& state, int64_t elapsedNs) {
    PipelineReport report;
    report.fps = instantaneousFps(state.intervalFrames, elapsedNs);

    const auto& timings = state.stageTimings;
    report.stages.reserve(timings.size());
    for (size_t i = 0; i < timings.size(); ++i) {
        report.stages.push_back({timings.nameAt(i), timings.at(i).mean() / kNanosecondsPerMillisecond});
    }

    report.correspondenceCount = state.correspondences.size();
    report.frameSize = state.frameSize;
    report.potentialFps = theoreticalMaxFps(timings);

    if (state.transformProducedThisInterval && !state.transform.empty()) {
        state.transform.convertTo(report.transform, CV_64F);
    }
    return report;
}

std::vector<std::string> PipelineReport::lines() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << std::setw(5) << fps << " fps : ";
    oss.unsetf(std::ios::floatfield);
    oss << std::setprecision(2);
    for (const auto& stage : stages) {
        oss << stage.name << " " << stage.mean_ms << " ms : ";
    }
    oss << std::setprecision(6);
    oss << correspondenceCount << " good matches in "
        << frameSize.width << "x" << frameSize.height
        << " frame (potential " << potentialFps << " fps)";

    std::vector<std::string> result{oss.str()};
    if (!transform.empty()) {
        for (int row = 0; row < 3; ++row) {
            result.push_back(formatTransformRow(transform, row));
        }
    }
    return result;
}

std::string PipelineReport::toString() const {
    std::string joined;
    for (const auto& line : lines()) {
        if (!joined.empty()) {
            joined += '\n';
        }
        joined += line;
    }
    return joined;
}

} // namespace target_finder::pipeline
