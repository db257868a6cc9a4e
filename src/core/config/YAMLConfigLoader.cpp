#include "YAMLConfigLoader.hpp"
#include "src/core/features/AlgorithmFactory.hpp"
#include "target_finder/logging.hpp"
#include <stdexcept>

namespace target_finder::config {

    RecognitionConfig YAMLConfigLoader::loadFromFile(const std::string& yaml_path) {
        try {
            YAML::Node root = YAML::LoadFile(yaml_path);
            RecognitionConfig config;
            applyYAML(root, config);
            validate(config, false);
            return config;
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("YAML parsing error in " + yaml_path + ": " + e.what());
        } catch (const std::exception& e) {
            throw std::runtime_error("Error loading " + yaml_path + ": " + e.what());
        }
    }

    RecognitionConfig YAMLConfigLoader::loadFromString(const std::string& yaml_content) {
        try {
            YAML::Node root = YAML::Load(yaml_content);
            RecognitionConfig config;
            applyYAML(root, config);
            validate(config, false);
            return config;
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(e.what());
        }
    }

    void YAMLConfigLoader::applyYAML(const YAML::Node& root, RecognitionConfig& config) {
        if (!root || root.IsNull()) {
            return;
        }
        if (!root.IsMap()) {
            throw std::runtime_error("Configuration root must be a mapping");
        }

        if (root["reference"]) {
            parseReference(root["reference"], config.reference);
        }
        if (root["input"]) {
            parseInput(root["input"], config.input);
        }
        if (root["algorithm"]) {
            parseAlgorithm(root["algorithm"], config.algorithm);
        }
        if (root["matching"]) {
            parseMatching(root["matching"], config.matching);
        }
        if (root["scheduling"]) {
            parseScheduling(root["scheduling"], config.scheduling);
        }
        if (root["logging"]) {
            parseLogging(root["logging"], config.logging);
        }
    }

    void YAMLConfigLoader::parseReference(const YAML::Node& node, RecognitionConfig::Reference& reference) {
        if (node["find"]) reference.find_path = node["find"].as<std::string>();
        if (node["superpose"]) reference.superpose_path = node["superpose"].as<std::string>();
    }

    void YAMLConfigLoader::parseInput(const YAML::Node& node, InputParams& input) {
        if (node["path"]) input.path = node["path"].as<std::string>();
        if (node["scale"]) input.scale = node["scale"].as<double>();
        if (node["camera_index"]) input.camera_index = node["camera_index"].as<int>();
        if (node["grayscale"]) input.grayscale = node["grayscale"].as<bool>();
    }

    void YAMLConfigLoader::parseAlgorithm(const YAML::Node& node, AlgorithmParams& algorithm) {
        // "using" takes the command-line form and is applied first so that
        // explicit keys below can refine it
        if (node["using"]) {
            algorithm = AlgorithmFactory::parseAlgorithm(node["using"].as<std::string>());
        }
        if (node["family"]) {
            algorithm.family = featureAlgorithmFromString(node["family"].as<std::string>());
        }
        if (node["surf_hessian_threshold"]) {
            algorithm.surf_hessian_threshold = node["surf_hessian_threshold"].as<double>();
        }
        if (node["orb_num_features"]) {
            algorithm.orb_num_features = node["orb_num_features"].as<int>();
        }
    }

    void YAMLConfigLoader::parseMatching(const YAML::Node& node, MatchingParams& matching) {
        if (node["ratio_threshold"]) matching.ratio_threshold = node["ratio_threshold"].as<float>();
        if (node["min_matches"]) matching.min_matches = node["min_matches"].as<int>();
        if (node["ransac_reprojection_threshold"]) {
            matching.ransac_reprojection_threshold = node["ransac_reprojection_threshold"].as<double>();
        }
    }

    void YAMLConfigLoader::parseScheduling(const YAML::Node& node, SchedulingParams& scheduling) {
        if (node["process_every"]) scheduling.process_every = node["process_every"].as<int>();
        if (node["report_interval_ms"]) scheduling.report_interval_ms = node["report_interval_ms"].as<int>();
        if (node["key_wait_ms"]) scheduling.key_wait_ms = node["key_wait_ms"].as<int>();
    }

    void YAMLConfigLoader::parseLogging(const YAML::Node& node, RecognitionConfig::Logging& logging) {
        if (node["level"]) logging.level = node["level"].as<std::string>();
    }

    void YAMLConfigLoader::validate(const RecognitionConfig& config, bool require_reference) {
        if (require_reference && config.reference.find_path.empty()) {
            throw std::runtime_error("A reference image is required (find=path)");
        }
        if (config.input.path.empty()) {
            throw std::runtime_error("Input path must not be empty; use 'webcam' for the capture device");
        }
        if (config.input.scale <= 0.0) {
            throw std::runtime_error("Input scale must be positive");
        }
        if (config.input.camera_index < 0) {
            throw std::runtime_error("Camera index must be non-negative");
        }
        if (config.algorithm.surf_hessian_threshold < 0.0) {
            throw std::runtime_error("SURF Hessian threshold must be non-negative");
        }
        if (config.algorithm.orb_num_features <= 0) {
            throw std::runtime_error("ORB feature count must be positive");
        }
        if (!(config.matching.ratio_threshold > 0.0f && config.matching.ratio_threshold <= 1.0f)) {
            throw std::runtime_error("Ratio threshold must be in (0, 1]");
        }
        if (config.matching.min_matches < 0) {
            throw std::runtime_error("Minimum match count must be non-negative");
        }
        if (config.matching.ransac_reprojection_threshold <= 0.0) {
            throw std::runtime_error("RANSAC reprojection threshold must be positive");
        }
        if (config.scheduling.process_every < 1) {
            throw std::runtime_error("Frame interval (every) must be at least 1");
        }
        if (config.scheduling.report_interval_ms <= 0) {
            throw std::runtime_error("Report interval must be positive");
        }
        if (config.scheduling.key_wait_ms <= 0) {
            throw std::runtime_error("Key wait must be positive; 0 would block every frame");
        }
        try {
            logging::levelFromString(config.logging.level);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(e.what());
        }
    }

    std::string YAMLConfigLoader::saveToString(const RecognitionConfig& config) {
        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "reference" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "find" << YAML::Value << config.reference.find_path;
        out << YAML::Key << "superpose" << YAML::Value << config.reference.superpose_path;
        out << YAML::EndMap;

        out << YAML::Key << "input" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << config.input.path;
        out << YAML::Key << "scale" << YAML::Value << config.input.scale;
        out << YAML::Key << "camera_index" << YAML::Value << config.input.camera_index;
        out << YAML::Key << "grayscale" << YAML::Value << config.input.grayscale;
        out << YAML::EndMap;

        out << YAML::Key << "algorithm" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "family" << YAML::Value << toString(config.algorithm.family);
        out << YAML::Key << "surf_hessian_threshold" << YAML::Value << config.algorithm.surf_hessian_threshold;
        out << YAML::Key << "orb_num_features" << YAML::Value << config.algorithm.orb_num_features;
        out << YAML::EndMap;

        out << YAML::Key << "matching" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "ratio_threshold" << YAML::Value << config.matching.ratio_threshold;
        out << YAML::Key << "min_matches" << YAML::Value << config.matching.min_matches;
        out << YAML::Key << "ransac_reprojection_threshold" << YAML::Value
            << config.matching.ransac_reprojection_threshold;
        out << YAML::EndMap;

        out << YAML::Key << "scheduling" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "process_every" << YAML::Value << config.scheduling.process_every;
        out << YAML::Key << "report_interval_ms" << YAML::Value << config.scheduling.report_interval_ms;
        out << YAML::Key << "key_wait_ms" << YAML::Value << config.scheduling.key_wait_ms;
        out << YAML::EndMap;

        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config.logging.level;
        out << YAML::EndMap;

        out << YAML::EndMap;
        return out.c_str();
    }

}
