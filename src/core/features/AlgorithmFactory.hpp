#pragma once

#include "src/interfaces/IFeatureExtractor.hpp"
#include "src/interfaces/INeighborMatcher.hpp"
#include "target_finder/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace target_finder {

/**
 * @brief Extractor and matcher chosen together for one algorithm family
 */
struct RecognitionAlgorithm {
    std::unique_ptr<IFeatureExtractor> extractor;
    std::unique_ptr<INeighborMatcher> matcher;
};

/**
 * @brief Factory for the detector/matcher pair used by the recognition loop
 *
 * The family is selected once at startup:
 * - SIFT: cv::SIFT + FLANN kd-tree search
 * - SURF: cv::xfeatures2d::SURF + FLANN kd-tree search
 * - ORB:  cv::ORB + brute-force Hamming search
 */
class AlgorithmFactory {
public:
    /**
     * @brief Create the extractor/matcher pair for the configured family
     * @throws std::invalid_argument for unknown families or bad parameters
     * @throws std::runtime_error if the family is unavailable in this OpenCV build
     */
    static RecognitionAlgorithm create(const AlgorithmParams& params);

    static std::unique_ptr<IFeatureExtractor> createExtractor(const AlgorithmParams& params);

    static std::unique_ptr<INeighborMatcher> createMatcher(FeatureAlgorithm family);

    /**
     * @brief Search back-end that suits the family's descriptor type
     */
    static NeighborSearch defaultSearchFor(FeatureAlgorithm family);

    /**
     * @brief Parse "NAME[:value]" such as "SIFT", "SURF:400" or "ORB:1000"
     *
     * The optional value is the SURF Hessian threshold or the ORB feature
     * count. SIFT takes no value and ignores one if given.
     *
     * @throws std::invalid_argument if the name or value is invalid
     */
    static AlgorithmParams parseAlgorithm(const std::string& text);

    /**
     * @brief Inverse of parseAlgorithm(), e.g. "ORB:500"
     */
    static std::string formatAlgorithm(const AlgorithmParams& params);

    static std::vector<std::string> getSupportedAlgorithms();

private:
    AlgorithmFactory() = default;
};

} // namespace target_finder
