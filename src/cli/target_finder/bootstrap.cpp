#include "bootstrap.hpp"
#include "src/core/io/CameraFrameSource.hpp"
#include "src/core/io/ImageLoader.hpp"
#include "src/core/io/StaticImageFrameSource.hpp"
#include "target_finder/logging.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>

namespace target_finder::cli::target_finder_bootstrap {

pipeline::ReferenceTarget loadReferenceTarget(const config::RecognitionConfig& config,
                                              IFeatureExtractor& extractor) {
    pipeline::ReferenceTarget target;
    target.image = io::loadImage(config.reference.find_path, config.input.grayscale);

    if (!config.reference.superpose_path.empty()) {
        const cv::Mat overlay = io::loadImage(config.reference.superpose_path, config.input.grayscale);
        cv::resize(overlay, target.overlay, target.image.size(), 0.0, 0.0, cv::INTER_AREA);
    }

    target.features = extractor.detectAndCompute(target.image);
    if (target.features.size() < kMinReferenceKeypoints) {
        throw std::runtime_error("Need at least " + std::to_string(kMinReferenceKeypoints) +
                                 " keypoints (3 non-colinear) from reference image; got " +
                                 std::to_string(target.features.size()));
    }

    LOG_INFO("Reference " + config.reference.find_path + ": " +
             std::to_string(target.image.cols) + "x" + std::to_string(target.image.rows) + ", " +
             std::to_string(target.features.size()) + " " + extractor.name() + " keypoints");
    return target;
}

std::unique_ptr<IFrameSource> openFrameSource(const config::RecognitionConfig& config) {
    if (config.input.useWebcam()) {
        return std::make_unique<io::CameraFrameSource>(config.input.camera_index, config.input.grayscale);
    }
    return std::make_unique<io::StaticImageFrameSource>(config.input.path, config.input.grayscale);
}

pipeline::SchedulerOptions makeSchedulerOptions(const config::RecognitionConfig& config) {
    pipeline::SchedulerOptions options;
    options.processEvery = config.scheduling.process_every;
    options.minMatches = config.matching.min_matches;
    options.ratioThreshold = config.matching.ratio_threshold;
    options.inputScale = config.input.scale;
    options.reportIntervalNs = static_cast<int64_t>(config.scheduling.report_interval_ms) * 1000000;
    options.keyWaitMs = config.scheduling.key_wait_ms;
    return options;
}

} // namespace target_finder::cli::target_finder_bootstrap
