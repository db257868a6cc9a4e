#pragma once

#include "RecognitionConfig.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

namespace target_finder::config {

    /**
     * @brief Loads and saves RecognitionConfig as YAML
     *
     * Example:
     * @code
     * reference: { find: box.png, superpose: logo.png }
     * input: { path: webcam, scale: 0.5 }
     * algorithm: { using: "ORB:1000" }
     * matching: { min_matches: 8 }
     * scheduling: { process_every: 2 }
     * @endcode
     *
     * Every key is optional; missing keys keep their defaults. Loading checks
     * value ranges but not that a reference image was named, since command
     * line parameters may still supply it.
     */
    class YAMLConfigLoader {
    public:
        /**
         * @throws std::runtime_error on unreadable files, YAML syntax errors or invalid values
         */
        static RecognitionConfig loadFromFile(const std::string& yaml_path);

        /**
         * @throws std::runtime_error on YAML syntax errors or invalid values
         */
        static RecognitionConfig loadFromString(const std::string& yaml_content);

        /**
         * @brief Overlay the keys present in root onto an existing configuration
         */
        static void applyYAML(const YAML::Node& root, RecognitionConfig& config);

        /**
         * @brief Check value ranges, and optionally that a reference image is named
         * @throws std::runtime_error describing the first invalid value
         */
        static void validate(const RecognitionConfig& config, bool require_reference = true);

        static std::string saveToString(const RecognitionConfig& config);

    private:
        static void parseReference(const YAML::Node& node, RecognitionConfig::Reference& reference);
        static void parseInput(const YAML::Node& node, InputParams& input);
        static void parseAlgorithm(const YAML::Node& node, AlgorithmParams& algorithm);
        static void parseMatching(const YAML::Node& node, MatchingParams& matching);
        static void parseScheduling(const YAML::Node& node, SchedulingParams& scheduling);
        static void parseLogging(const YAML::Node& node, RecognitionConfig::Logging& logging);
    };

}
