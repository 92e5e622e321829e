#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace declutter {

inline namespace detail_v1 {

// folder granularity of the classifier
enum class bucket_t {
  date,    // YYYY-MM-DD
  quarter  // YYYY-QN
};

/**
 * @brief parse mode token, unknown tokens fall back to date
 */
bucket_t parse_bucket(std::string_view token) noexcept;

std::string_view to_string(const bucket_t bucket) noexcept;

/**
 * @brief "YYYY-MM-DD" -> "YYYY-QN", quarter is (month - 1) / 3 + 1
 */
std::optional<std::string> quarter_key(std::string_view date);

/**
 * @brief folder name of an ISO date under the given mode
 */
std::optional<std::string> bucket_key(std::string_view date,
                                      const bucket_t bucket);

// totals of one classification pass, organized + skipped == total
struct classify_t {
  std::size_t total = 0;
  std::size_t organized = 0;
  std::size_t skipped = 0;
};

/**
 * @brief move every image under dir into dir/<key>/
 *
 * The key comes from the EXIF capture date, else the modification date. A
 * file whose name is already taken in its folder is skipped, never
 * overwritten. Quarantine folders are left alone: every duplicates_* folder
 * directly under dir, and every folder in skip_dirs.
 *
 * @throws std::invalid_argument if dir is not a directory
 */
classify_t classify(const std::filesystem::path &dir, const bucket_t bucket,
                    const std::vector<std::filesystem::path> &skip_dirs = {});

}  // namespace detail_v1

}  // namespace declutter
