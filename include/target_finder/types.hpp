#pragma once

#include <opencv2/core.hpp>
#include <opencv2/features2d.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace target_finder {

    // ================================
    // ALGORITHM SELECTION
    // ================================

    /**
     * @brief Feature detector/descriptor families available for recognition
     */
    enum class FeatureAlgorithm {
        SIFT,                  ///< OpenCV SIFT, float descriptors
        SURF,                  ///< OpenCV SURF (requires opencv_contrib xfeatures2d)
        ORB                    ///< OpenCV ORB, binary descriptors
    };

    /**
     * @brief Nearest-neighbour search back-ends
     */
    enum class NeighborSearch {
        FLANN_KDTREE,          ///< FLANN randomized kd-trees for float descriptors
        BRUTE_FORCE_HAMMING    ///< Exhaustive Hamming search for binary descriptors
    };

    /**
     * @brief Kind of frame source the scheduler is driving
     */
    enum class SourceKind {
        WEBCAM,                ///< Live capture device, processed as a stream
        IMAGE_FILE             ///< Static image, single-shot processing
    };

    inline std::string toString(FeatureAlgorithm algorithm) {
        switch (algorithm) {
            case FeatureAlgorithm::SIFT: return "sift";
            case FeatureAlgorithm::SURF: return "surf";
            case FeatureAlgorithm::ORB: return "orb";
            default: return "unknown";
        }
    }

    inline std::string toString(NeighborSearch search) {
        switch (search) {
            case NeighborSearch::FLANN_KDTREE: return "flann_kdtree";
            case NeighborSearch::BRUTE_FORCE_HAMMING: return "brute_force_hamming";
            default: return "unknown";
        }
    }

    inline std::string toString(SourceKind kind) {
        switch (kind) {
            case SourceKind::WEBCAM: return "webcam";
            case SourceKind::IMAGE_FILE: return "image_file";
            default: return "unknown";
        }
    }

    /**
     * @brief Parse an algorithm family name, case-insensitive
     * @throws std::invalid_argument if the name is not a known family
     */
    inline FeatureAlgorithm featureAlgorithmFromString(std::string name) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "sift") return FeatureAlgorithm::SIFT;
        if (name == "surf") return FeatureAlgorithm::SURF;
        if (name == "orb") return FeatureAlgorithm::ORB;
        throw std::invalid_argument("Unknown recogniser '" + name + "'");
    }

    // ================================
    // PIPELINE DATA
    // ================================

    /**
     * @brief Keypoints paired index-for-index with their descriptor rows
     *
     * Produced once for the reference image and once per processed scene
     * frame. A new frame replaces the set rather than editing it.
     */
    struct FeatureSet {
        std::vector<cv::KeyPoint> keypoints;
        cv::Mat descriptors;

        size_t size() const { return keypoints.size(); }
        bool empty() const { return keypoints.empty(); }
    };

    // Candidate lists and accepted correspondences are plain cv::DMatch values:
    // queryIdx indexes the reference FeatureSet, trainIdx the scene FeatureSet.
    using CandidateMatches = std::vector<std::vector<cv::DMatch>>;
    using Correspondences = std::vector<cv::DMatch>;

    // ================================
    // PARAMETER STRUCTURES
    // ================================

    struct AlgorithmParams {
        FeatureAlgorithm family = FeatureAlgorithm::SIFT;
        double surf_hessian_threshold = 400.0;
        int orb_num_features = 500;
    };

    struct InputParams {
        std::string path = "webcam";   // "webcam" selects the capture device
        double scale = 1.0;            // 1.0 = no resize
        int camera_index = 0;
        bool grayscale = false;

        bool useWebcam() const {
            std::string lowered = path;
            std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return lowered == "webcam";
        }
    };

    struct MatchingParams {
        float ratio_threshold = 0.7f;          // Lowe ratio test
        int min_matches = 4;                   // transform attempted only above this
        double ransac_reprojection_threshold = 3.0;
    };

    struct SchedulingParams {
        int process_every = 1;                 // run expensive stages every N frames
        int report_interval_ms = 1000;
        int key_wait_ms = 30;                  // streaming key poll delay
    };

} // namespace target_finder
