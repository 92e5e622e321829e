#pragma once

#include <array>
#include <string_view>

#define DECLUTTER_EXPORT __attribute__((visibility("default")))

namespace declutter {

// 8KiB
constexpr auto read_blk_sz = 8UL * 1024UL;

// perceptual hash grid and low frequency block
constexpr auto phash_grid = 32;
constexpr auto phash_blk = 8;

// bare TIFF files larger than this are not searched for EXIF
constexpr auto exif_tiff_max = 64UL * 1024UL * 1024UL;

// upper bound of hashing workers
constexpr auto max_hash_workers = 8U;

constexpr std::string_view quarantine_prefix = "duplicates_";
constexpr std::string_view audit_log_prefix = "duplicate_files_log_";
constexpr std::string_view default_digest = "md5";

constexpr std::array<std::string_view, 6> image_exts = {
    ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff"};

}  // namespace declutter
