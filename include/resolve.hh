#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "file_entry.hh"
#include "group_dupes.hh"
#include "keep.hh"

namespace declutter {

inline namespace detail_v1 {

struct resolve_t {
  std::size_t moved_cnt = 0;
  uint64_t moved_bytes = 0;
  // in move order
  std::vector<file_record_t> moved;
  std::filesystem::path quarantine_dir;
};

/**
 * @brief duplicates_<YYYYMMDD_HHMMSS> in local time
 */
std::string quarantine_name(const time_point_t when);

/**
 * @brief keep one survivor per class and move the rest into a quarantine
 * folder.
 *
 * The folder is created on the first move. A candidate whose basename is
 * already taken in the folder is left in place and not counted, as is any
 * candidate that fails to move.
 *
 * @param dupes duplicate classes, reordered by the strategy
 * @param keep retention strategy
 * @param parent directory the quarantine folder is placed in
 * @param when timestamp used to name the quarantine folder
 */
resolve_t resolve_dupes(
    std::vector<dupe_class_t> dupes, const keep_t keep,
    const std::filesystem::path &parent = std::filesystem::current_path(),
    const time_point_t when = std::chrono::system_clock::now());

}  // namespace detail_v1

}  // namespace declutter
