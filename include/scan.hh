#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "config.hh"
#include "dispatch.hh"
#include "group_dupes.hh"

namespace declutter {

inline namespace detail_v1 {

struct scan_result_t {
  std::vector<dupe_class_t> image_dupes;
  std::vector<dupe_class_t> generic_dupes;
};

/**
 * @brief list, fingerprint and group every file under dir
 *
 * @param dir root directory
 * @param max_thread hashing pool size, 0 means default_threads()
 * @param algo digest name supported by libcrypto
 * @param progress optional hashing progress callback
 * @throws std::invalid_argument if dir is not a directory or algo is unknown
 */
scan_result_t scan(const std::filesystem::path &dir, uint32_t max_thread = 0,
                   const std::string &algo = std::string(default_digest),
                   const progress_fn &progress = {});

/**
 * @throws std::invalid_argument if dir is not a directory
 */
void check_dir(const std::filesystem::path &dir);

}  // namespace detail_v1

}  // namespace declutter
