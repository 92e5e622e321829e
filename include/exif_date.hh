#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

namespace declutter {

inline namespace detail_v1 {

/**
 * @brief DateTimeOriginal (0x9003) of a JPEG (APP1 Exif) or TIFF file
 *
 * @return "YYYY-MM-DD", nullopt if the tag is missing, malformed or the file
 * can not be read
 */
std::optional<std::string> read_exif_date(const std::filesystem::path &path);

/**
 * @brief DateTimeOriginal of a TIFF structured block ("II*\0" or "MM\0*")
 */
std::optional<std::string> tiff_exif_date(std::span<const uint8_t> tiff);

}  // namespace detail_v1

}  // namespace declutter
