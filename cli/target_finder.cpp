#include "src/cli/target_finder/bootstrap.hpp"
#include "src/cli/target_finder/cli_args.hpp"
#include "src/core/features/AlgorithmFactory.hpp"
#include "src/core/localization/HomographySolver.hpp"
#include "src/core/pipeline/FrameScheduler.hpp"
#include "src/core/render/HighGuiRenderer.hpp"
#include "target_finder/logging.hpp"
#include <exception>

using namespace target_finder;
namespace bootstrap = target_finder::cli::target_finder_bootstrap;
namespace cli_args = target_finder::cli::target_finder_cli;

int main(int argc, char** argv) {
    try {
        auto parsed = cli_args::parseArgs(argc, argv);
        if (!parsed) {
            return 1;
        }
        const config::RecognitionConfig& config = *parsed;

        logging::setLevel(logging::levelFromString(config.logging.level));
        cli_args::logParameters(config);

        RecognitionAlgorithm algorithm = AlgorithmFactory::create(config.algorithm);
        const pipeline::ReferenceTarget target = bootstrap::loadReferenceTarget(config, *algorithm.extractor);

        render::HighGuiRenderer renderer;
        auto source = bootstrap::openFrameSource(config);
        localization::HomographySolver solver(config.matching.ransac_reprojection_threshold);

        pipeline::FrameScheduler scheduler(*source, *algorithm.extractor, *algorithm.matcher,
                                           solver, renderer, target,
                                           bootstrap::makeSchedulerOptions(config));

        LOG_INFO("Searching " + source->describe() + " (" + toString(source->kind()) + ")");
        pipeline::PipelineState state;
        const uint64_t frames = scheduler.run(state);
        LOG_INFO("Processed " + std::to_string(frames) + " frames");
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR(e.what());
        return 1;
    }
}
