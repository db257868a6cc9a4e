#include "AlgorithmFactory.hpp"
#include "extractors/SIFTFeatureExtractor.hpp"
#include "extractors/SURFFeatureExtractor.hpp"
#include "extractors/ORBFeatureExtractor.hpp"
#include "src/core/matching/FLANNNeighborMatcher.hpp"
#include "src/core/matching/BruteForceNeighborMatcher.hpp"
#include "target_finder/logging.hpp"
#include <sstream>
#include <stdexcept>

namespace target_finder {

RecognitionAlgorithm AlgorithmFactory::create(const AlgorithmParams& params) {
    RecognitionAlgorithm algorithm;
    algorithm.extractor = createExtractor(params);
    algorithm.matcher = createMatcher(params.family);

    LOG_INFO("Using " + algorithm.extractor->name() + " features with " +
             algorithm.matcher->name() + " matching");
    return algorithm;
}

std::unique_ptr<IFeatureExtractor> AlgorithmFactory::createExtractor(const AlgorithmParams& params) {
    switch (params.family) {
        case FeatureAlgorithm::SIFT:
            return std::make_unique<SIFTFeatureExtractor>();

        case FeatureAlgorithm::SURF:
            if (params.surf_hessian_threshold < 0.0) {
                throw std::invalid_argument("SURF Hessian threshold must be non-negative");
            }
            return std::make_unique<SURFFeatureExtractor>(params.surf_hessian_threshold);

        case FeatureAlgorithm::ORB:
            if (params.orb_num_features <= 0) {
                throw std::invalid_argument("ORB feature count must be positive");
            }
            return std::make_unique<ORBFeatureExtractor>(params.orb_num_features);

        default:
            throw std::invalid_argument("Unsupported feature algorithm: " +
                                        std::to_string(static_cast<int>(params.family)));
    }
}

std::unique_ptr<INeighborMatcher> AlgorithmFactory::createMatcher(FeatureAlgorithm family) {
    switch (defaultSearchFor(family)) {
        case NeighborSearch::FLANN_KDTREE:
            return std::make_unique<matching::FLANNNeighborMatcher>();

        case NeighborSearch::BRUTE_FORCE_HAMMING:
            return std::make_unique<matching::BruteForceNeighborMatcher>(cv::NORM_HAMMING);

        default:
            throw std::invalid_argument("Unsupported neighbour search back-end");
    }
}

NeighborSearch AlgorithmFactory::defaultSearchFor(FeatureAlgorithm family) {
    switch (family) {
        case FeatureAlgorithm::SIFT:
        case FeatureAlgorithm::SURF:
            return NeighborSearch::FLANN_KDTREE;
        case FeatureAlgorithm::ORB:
            return NeighborSearch::BRUTE_FORCE_HAMMING;
        default:
            throw std::invalid_argument("Unsupported feature algorithm: " +
                                        std::to_string(static_cast<int>(family)));
    }
}

AlgorithmParams AlgorithmFactory::parseAlgorithm(const std::string& text) {
    AlgorithmParams params;

    const auto colon = text.find(':');
    const std::string name = text.substr(0, colon);
    const bool hasValue = colon != std::string::npos && colon + 1 < text.size();
    const std::string value = hasValue ? text.substr(colon + 1) : std::string();

    params.family = featureAlgorithmFromString(name);

    if (!hasValue) {
        return params;
    }

    try {
        size_t consumed = 0;
        switch (params.family) {
            case FeatureAlgorithm::SURF:
                params.surf_hessian_threshold = std::stod(value, &consumed);
                break;
            case FeatureAlgorithm::ORB:
                params.orb_num_features = std::stoi(value, &consumed);
                break;
            case FeatureAlgorithm::SIFT:
                LOG_WARNING("SIFT takes no parameter; ignoring '" + value + "'");
                return params;
        }
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid parameter '" + value + "' for " + toString(params.family));
    }

    return params;
}

std::string AlgorithmFactory::formatAlgorithm(const AlgorithmParams& params) {
    std::ostringstream oss;
    switch (params.family) {
        case FeatureAlgorithm::SIFT:
            oss << "SIFT";
            break;
        case FeatureAlgorithm::SURF:
            oss << "SURF:" << params.surf_hessian_threshold;
            break;
        case FeatureAlgorithm::ORB:
            oss << "ORB:" << params.orb_num_features;
            break;
    }
    return oss.str();
}

std::vector<std::string> AlgorithmFactory::getSupportedAlgorithms() {
    return {
        "SIFT",
        "SURF",
        "ORB"
    };
}

} // namespace target_finder
