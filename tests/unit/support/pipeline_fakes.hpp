#pragma once

#include "src/interfaces/IFeatureExtractor.hpp"
#include "src/interfaces/IFrameSource.hpp"
#include "src/interfaces/INeighborMatcher.hpp"
#include "src/interfaces/IRenderer.hpp"
#include "src/interfaces/ITransformSolver.hpp"
#include <opencv2/core.hpp>
#include <deque>
#include <vector>

namespace target_finder::fakes {

// Feature set with `count` keypoints on a diagonal and one CV_32F row each
inline FeatureSet makeFeatures(int count) {
    FeatureSet features;
    features.descriptors = cv::Mat::zeros(count, 8, CV_32F);
    for (int i = 0; i < count; ++i) {
        features.keypoints.emplace_back(10.0f + 10.0f * i, 5.0f + 7.0f * i, 8.0f);
        features.descriptors.at<float>(i, i % 8) = static_cast<float>(i + 1);
    }
    return features;
}

class FakeFrameSource : public IFrameSource {
public:
    FakeFrameSource(int frames, bool streaming, cv::Size size = cv::Size(100, 100))
        : remaining_(frames), streaming_(streaming), size_(size) {}

    bool next(cv::Mat& frame) override {
        ++nextCalls;
        if (remaining_ <= 0) {
            return false;
        }
        --remaining_;
        frame = cv::Mat(size_, CV_8UC3, cv::Scalar(40, 80, 120));
        return true;
    }

    bool isStreaming() const override { return streaming_; }
    SourceKind kind() const override { return streaming_ ? SourceKind::WEBCAM : SourceKind::IMAGE_FILE; }
    std::string describe() const override { return "fake"; }

    int nextCalls = 0;

private:
    int remaining_;
    bool streaming_;
    cv::Size size_;
};

class FakeExtractor : public IFeatureExtractor {
public:
    explicit FakeExtractor(int keypointsPerFrame) : keypointsPerFrame(keypointsPerFrame) {}

    FeatureSet detectAndCompute(const cv::Mat& image) override {
        ++calls;
        lastImageSize = image.size();
        return makeFeatures(keypointsPerFrame);
    }

    std::string name() const override { return "Fake"; }
    FeatureAlgorithm type() const override { return FeatureAlgorithm::ORB; }

    int keypointsPerFrame;
    int calls = 0;
    cv::Size lastImageSize;
};

// Every query row gets a clear winner, so every row passes a 0.7 ratio test
class FakeMatcher : public INeighborMatcher {
public:
    CandidateMatches knnMatch(const cv::Mat& query, const cv::Mat& train, int k) override {
        ++calls;
        lastK = k;
        CandidateMatches candidates;
        for (int q = 0; q < query.rows; ++q) {
            const int best = q % train.rows;
            const int second = (q + 1) % train.rows;
            candidates.push_back({cv::DMatch(q, best, 1.0f), cv::DMatch(q, second, 10.0f)});
        }
        return candidates;
    }

    std::string name() const override { return "FakeMatcher"; }
    NeighborSearch type() const override { return NeighborSearch::BRUTE_FORCE_HAMMING; }

    int calls = 0;
    int lastK = 0;
};

// Returns scripted results in order, then repeats the last one
class FakeSolver : public ITransformSolver {
public:
    explicit FakeSolver(bool succeed = true) { results.push_back(succeed); }

    cv::Mat estimate(const std::vector<cv::Point2f>& source,
                     const std::vector<cv::Point2f>& target) override {
        ++calls;
        lastSource = source;
        lastTarget = target;
        bool succeed = results.front();
        if (results.size() > 1) {
            results.pop_front();
        }
        return succeed ? cv::Mat::eye(3, 3, CV_64F) : cv::Mat();
    }

    std::deque<bool> results;
    int calls = 0;
    std::vector<cv::Point2f> lastSource;
    std::vector<cv::Point2f> lastTarget;
};

class FakeRenderer : public IRenderer {
public:
    void render(const RenderRequest& request) override {
        ++renders;
        const bool located = request.transform != nullptr && !request.transform->empty();
        renderedWithTransform.push_back(located);
        lastCorrespondenceCount = request.correspondences ? request.correspondences->size() : 0;
    }

    int waitKey(int delayMs) override {
        waitDelays.push_back(delayMs);
        if (keys.empty()) {
            return -1;
        }
        const int key = keys.front();
        keys.pop_front();
        return key;
    }

    int renders = 0;
    std::vector<bool> renderedWithTransform;
    size_t lastCorrespondenceCount = 0;
    std::deque<int> keys;
    std::vector<int> waitDelays;
};

} // namespace target_finder::fakes
