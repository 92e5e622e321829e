#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

namespace declutter {

inline namespace detail_v1 {

/**
 * @brief DCT based perceptual hash of a decoded image
 *
 * The image is shrunk to a 32x32 luminance grid with area interpolation,
 * transformed with a 2-D DCT, and the top-left 8x8 block minus its first row
 * (56 coefficients) is thresholded against its own mean.
 *
 * @param image 1, 3 or 4 channel image, alpha is dropped
 * @return 14 hex chars (56 bits, MSB first)
 * @throws cv::Exception if the image is empty or of unsupported layout
 */
std::string phash_of(const cv::Mat &image);

/**
 * @brief decode and hash an image file
 *
 * @return nullopt if the file can not be decoded
 */
std::optional<std::string> image_phash(const std::filesystem::path &path);

}  // namespace detail_v1

}  // namespace declutter
