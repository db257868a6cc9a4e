#include "MatchComposer.hpp"
#include <opencv2/features2d.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <stdexcept>

namespace target_finder::render {

namespace {

cv::Mat matchChannels(const cv::Mat& image, int channels) {
    if (image.channels() == channels) {
        return image;
    }
    cv::Mat converted;
    if (channels == 1) {
        cv::cvtColor(image, converted, image.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    } else if (channels == 3) {
        cv::cvtColor(image, converted, image.channels() == 4 ? cv::COLOR_BGRA2BGR : cv::COLOR_GRAY2BGR);
    } else {
        throw std::invalid_argument("Unsupported channel count: " + std::to_string(channels));
    }
    return converted;
}

bool hasTransform(const RenderRequest& request) {
    return request.transform != nullptr && !request.transform->empty();
}

}

std::vector<cv::Point2f> projectOutline(const cv::Size& referenceSize, const cv::Mat& transform) {
    const float right = static_cast<float>(referenceSize.width - 1);
    const float bottom = static_cast<float>(referenceSize.height - 1);
    std::vector<cv::Point2f> corners = {
        {0.0f, 0.0f},
        {0.0f, bottom},
        {right, bottom},
        {right, 0.0f}
    };

    std::vector<cv::Point2f> projected;
    cv::perspectiveTransform(corners, projected, transform);
    return projected;
}

cv::Mat superpose(const cv::Mat& scene, const cv::Mat& overlay, const cv::Mat& transform) {
    cv::Mat warped;
    cv::warpPerspective(matchChannels(overlay, scene.channels()), warped, transform, scene.size());

    cv::Mat combined;
    cv::add(scene, warped, combined);
    return combined;
}

cv::Mat composeSideBySide(const cv::Mat& reference, const cv::Mat& scene) {
    const cv::Mat left = matchChannels(reference, scene.channels());

    cv::Mat canvas = cv::Mat::zeros(std::max(left.rows, scene.rows), left.cols + scene.cols, scene.type());
    left.copyTo(canvas(cv::Rect(0, 0, left.cols, left.rows)));
    scene.copyTo(canvas(cv::Rect(left.cols, 0, scene.cols, scene.rows)));
    return canvas;
}

cv::Mat composeMatchView(const RenderRequest& request) {
    if (request.reference == nullptr || request.reference->empty() ||
        request.scene == nullptr || request.scene->empty()) {
        throw std::invalid_argument("Match view needs both a reference and a scene image");
    }

    const cv::Mat& reference = *request.reference;
    if (!hasTransform(request) || request.referenceFeatures == nullptr ||
        request.sceneFeatures == nullptr || request.correspondences == nullptr) {
        return composeSideBySide(reference, *request.scene);
    }

    const cv::Mat& transform = *request.transform;
    cv::Mat scene = request.scene->clone();

    if (request.overlay != nullptr && !request.overlay->empty()) {
        scene = superpose(scene, *request.overlay, transform);
    }

    std::vector<cv::Point> outline;
    for (const auto& corner : projectOutline(reference.size(), transform)) {
        outline.emplace_back(cvRound(corner.x), cvRound(corner.y));
    }
    cv::polylines(scene, std::vector<std::vector<cv::Point>>{outline}, true,
                  cv::Scalar(255), 3, cv::LINE_AA);

    cv::Mat view;
    cv::drawMatches(reference, request.referenceFeatures->keypoints,
                    scene, request.sceneFeatures->keypoints,
                    *request.correspondences, view,
                    cv::Scalar::all(-1), cv::Scalar::all(-1), std::vector<char>(),
                    cv::DrawMatchesFlags::NOT_DRAW_SINGLE_POINTS);
    return view;
}

} // namespace target_finder::render
