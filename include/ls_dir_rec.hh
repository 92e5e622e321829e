#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include "file_entry.hh"

namespace declutter {

inline namespace detail_v1 {

/**
 * @brief lstat snapshot of a single path
 *
 * @return nullopt if lstat fails or path is not a regular file
 */
std::optional<dir_entry_t> stat_entry(const std::filesystem::path &path);

/**
 * @brief list directory recursively,
 * skip symlink, skip unreadable directory, no order guarantee
 *
 * @param dir directory path
 * @param[out] entries regular files including empty ones
 */
void ls_dir_rec(const std::filesystem::path &dir,
                std::vector<dir_entry_t> &entries);

inline std::vector<dir_entry_t> ls_dir_rec(const std::filesystem::path &dir) {
  std::vector<dir_entry_t> entries;
  ls_dir_rec(dir, entries);
  return entries;
}

}  // namespace detail_v1

}  // namespace declutter
