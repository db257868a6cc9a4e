#pragma once

#include "target_finder/types.hpp"
#include <string>

namespace target_finder::config {

    /**
     * @brief Complete configuration of one recognition session
     *
     * Defaults reproduce the command-line defaults: webcam input at scale 1.0,
     * SIFT, ratio 0.7, more than 4 matches for a transform, every frame
     * processed, one report per second.
     */
    struct RecognitionConfig {
        // Target description
        struct Reference {
            std::string find_path;        // required
            std::string superpose_path;   // empty = no overlay
        } reference;

        InputParams input;
        AlgorithmParams algorithm;
        MatchingParams matching;
        SchedulingParams scheduling;

        struct Logging {
            std::string level = "info";
        } logging;
    };

}
