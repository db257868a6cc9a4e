#include "cli_args.hpp"
#include "src/core/config/YAMLConfigLoader.hpp"
#include "src/core/features/AlgorithmFactory.hpp"
#include "target_finder/logging.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace target_finder::cli::target_finder_cli {

namespace {

int parseInt(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Parameter '" + key + "' expects an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Parameter '" + key + "' expects an integer, got '" + value + "'");
    }
    return parsed;
}

double parseDouble(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Parameter '" + key + "' expects a number, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Parameter '" + key + "' expects a number, got '" + value + "'");
    }
    return parsed;
}

bool parseBool(const std::string& key, std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw std::invalid_argument("Parameter '" + key + "' expects true/false, got '" + value + "'");
}

bool splitToken(const std::string& token, std::string& key, std::string& value) {
    const auto eq = token.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    key = token.substr(0, eq);
    value = token.substr(eq + 1);
    return true;
}

}

void printUsage(const std::string& binaryName) {
    std::cout << std::endl;
    std::cout << "Usage : " << binaryName
              << " find=path [in=path] [using=x] [superpose=x] [min=N] [every=N]" << std::endl;
    std::cout << std::endl;
    std::cout << "Where:" << std::endl;
    std::cout << std::endl;
    std::cout << "  find      : path to image to detect" << std::endl;
    std::cout << "  in        : OPTIONAL path to image in which to search (default: 'webcam', i.e. use webcam feed)" << std::endl;
    std::cout << "  using     : OPTIONAL algorithm to use, one of 'SURF', 'SIFT', or 'ORB' (default: SIFT)" << std::endl;
    std::cout << "  superpose : OPTIONAL path to image to superpose onto matched region" << std::endl;
    std::cout << "  min       : OPTIONAL minimum N matching features before bounding box drawn (default: 4)" << std::endl;
    std::cout << "  every     : OPTIONAL run processing every N frames (default: 1)" << std::endl;
    std::cout << std::endl;
    std::cout << "Additional options:" << std::endl;
    std::cout << std::endl;
    std::cout << "  config    : YAML file with defaults; other parameters override it" << std::endl;
    std::cout << "  ratio     : Lowe ratio test threshold (default: 0.7)" << std::endl;
    std::cout << "  ransac    : RANSAC reprojection threshold in pixels (default: 3.0)" << std::endl;
    std::cout << "  camera    : capture device index (default: 0)" << std::endl;
    std::cout << "  grayscale : process grayscale images (default: false)" << std::endl;
    std::cout << "  report_ms : statistics report interval in milliseconds (default: 1000)" << std::endl;
    std::cout << "  log       : log level, one of debug, info, warning, error (default: info)" << std::endl;
    std::cout << std::endl;
    std::cout << "Notes:" << std::endl;
    std::cout << std::endl;
    std::cout << "The SURF and ORB algorithms can be accompanied with algorithm-specific data;" << std::endl;
    std::cout << "  - for SURF, this is the Hessian tolerance e.g. 'using=SURF:400' (default value: 400)" << std::endl;
    std::cout << "  - for ORB, this is the number of features e.g. 'using=ORB:500' (default value: 500)" << std::endl;
    std::cout << std::endl;
    std::cout << "The 'in' parameter can be decorated with a scale value for the data, e.g.: in=webcam:0.5," << std::endl;
    std::cout << "in=mypic.png:1.5. The default scale value is 1.0 (i.e., no scaling will be performed)." << std::endl;
    std::cout << std::endl;
}

void applyParameter(config::RecognitionConfig& config, const std::string& key, const std::string& value) {
    if (key == "find") {
        config.reference.find_path = value;
    } else if (key == "superpose") {
        config.reference.superpose_path = value;
    } else if (key == "in") {
        const auto colon = value.find(':');
        config.input.path = value.substr(0, colon);
        config.input.scale = 1.0;
        if (colon != std::string::npos) {
            config.input.scale = parseDouble(key, value.substr(colon + 1));
        }
    } else if (key == "using") {
        config.algorithm = AlgorithmFactory::parseAlgorithm(value);
    } else if (key == "min") {
        config.matching.min_matches = parseInt(key, value);
    } else if (key == "every") {
        config.scheduling.process_every = parseInt(key, value);
    } else if (key == "ratio") {
        config.matching.ratio_threshold = static_cast<float>(parseDouble(key, value));
    } else if (key == "ransac") {
        config.matching.ransac_reprojection_threshold = parseDouble(key, value);
    } else if (key == "camera") {
        config.input.camera_index = parseInt(key, value);
    } else if (key == "grayscale") {
        config.input.grayscale = parseBool(key, value);
    } else if (key == "report_ms") {
        config.scheduling.report_interval_ms = parseInt(key, value);
    } else if (key == "log") {
        config.logging.level = value;
    } else {
        throw std::invalid_argument("Unknown parameter '" + key + "'");
    }
}

config::RecognitionConfig parseParameters(const std::vector<std::string>& tokens) {
    config::RecognitionConfig config;
    std::vector<std::pair<std::string, std::string>> overrides;

    for (const auto& token : tokens) {
        std::string key;
        std::string value;
        if (!splitToken(token, key, value)) {
            LOG_WARNING("Ignoring argument '" + token + "' (expected key=value)");
            continue;
        }
        if (key == "config") {
            config = config::YAMLConfigLoader::loadFromFile(value);
            LOG_INFO("Loaded configuration from " + value);
        } else {
            overrides.emplace_back(key, value);
        }
    }

    for (const auto& [key, value] : overrides) {
        applyParameter(config, key, value);
    }

    config::YAMLConfigLoader::validate(config);
    return config;
}

std::optional<config::RecognitionConfig> parseArgs(int argc, char** argv) {
    const std::string binaryName = argc > 0 ? argv[0] : "target_finder";
    if (argc < 2) {
        printUsage(binaryName);
        return std::nullopt;
    }

    std::vector<std::string> tokens;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(binaryName);
            return std::nullopt;
        }
        tokens.push_back(arg);
    }

    return parseParameters(tokens);
}

void logParameters(const config::RecognitionConfig& config) {
    LOG_INFO("Parameters:");
    LOG_INFO("  find : " + config.reference.find_path);
    LOG_INFO("  in : " + config.input.path + " (scale " + std::to_string(config.input.scale) + ")");
    LOG_INFO("  using : " + AlgorithmFactory::formatAlgorithm(config.algorithm));
    LOG_INFO("  superpose : " + config.reference.superpose_path);
    LOG_INFO("  min : " + std::to_string(config.matching.min_matches));
    LOG_INFO("  every : " + std::to_string(config.scheduling.process_every));
    LOG_INFO("  ratio : " + std::to_string(config.matching.ratio_threshold));
    LOG_INFO("  ransac : " + std::to_string(config.matching.ransac_reprojection_threshold));
}

} // namespace target_finder::cli::target_finder_cli
