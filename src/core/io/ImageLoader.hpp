#pragma once

#include <opencv2/core.hpp>
#include <string>

namespace target_finder::io {

/**
 * @brief Read an image from disk
 * @param path Image file path
 * @param grayscale Convert to single-channel grayscale after loading
 * @return Loaded image, never empty
 * @throws std::runtime_error if the file cannot be read or decoded
 */
cv::Mat loadImage(const std::string& path, bool grayscale = false);

/**
 * @brief Resize by a uniform factor; a factor of 1.0 returns the input unchanged
 * @throws std::invalid_argument for non-positive factors
 */
cv::Mat scaleImage(const cv::Mat& image, double scale);

} // namespace target_finder::io
