#pragma once

#include "src/interfaces/IRenderer.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace target_finder::render {

/**
 * @brief Corners of a reference image mapped into the scene
 *
 * Corner order: top-left, bottom-left, bottom-right, top-right.
 */
std::vector<cv::Point2f> projectOutline(const cv::Size& referenceSize, const cv::Mat& transform);

/**
 * @brief Warp the overlay into scene coordinates and add it onto the scene
 *
 * The overlay is converted to the scene's channel count first. Pixel values
 * saturate (cv::add).
 */
cv::Mat superpose(const cv::Mat& scene, const cv::Mat& overlay, const cv::Mat& transform);

/**
 * @brief Reference on the left, scene on the right, no match lines
 *
 * Mirrors the cv::drawMatches() layout so the window does not jump between
 * located and not-located frames.
 */
cv::Mat composeSideBySide(const cv::Mat& reference, const cv::Mat& scene);

/**
 * @brief Build the display image for one frame
 *
 * With a transform: optional overlay, outline of the located region and
 * correspondence lines. Without one: side-by-side layout.
 *
 * @throws std::invalid_argument if the reference or scene image is missing
 */
cv::Mat composeMatchView(const RenderRequest& request);

} // namespace target_finder::render
