#pragma once

#include "src/core/config/RecognitionConfig.hpp"
#include <optional>
#include <string>
#include <vector>

namespace target_finder::cli::target_finder_cli {

void printUsage(const std::string& binaryName);

// Apply one key=value parameter. Values may carry a ':' suffix, e.g.
// in=webcam:0.5 or using=SURF:400. Throws std::invalid_argument on unknown
// keys or malformed values.
void applyParameter(config::RecognitionConfig& config, const std::string& key, const std::string& value);

// Build a configuration from key=value tokens. A config=<file.yaml> token is
// loaded first and the remaining tokens override it. The result is validated
// (std::runtime_error on invalid values).
config::RecognitionConfig parseParameters(const std::vector<std::string>& tokens);

// Parse argv, handling --help/-h and an empty argument list.
// Returns std::nullopt after printing usage.
std::optional<config::RecognitionConfig> parseArgs(int argc, char** argv);

// Log the effective parameters, one per line.
void logParameters(const config::RecognitionConfig& config);

} // namespace target_finder::cli::target_finder_cli
