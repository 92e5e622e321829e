#pragma once

#include <string>
#include <vector>

#include "file_entry.hh"
#include "fingerprint.hh"

namespace declutter {

inline namespace detail_v1 {

// files sharing (kind, fingerprint), always more than one
struct dupe_class_t {
  file_kind_t kind;
  std::string fingerprint;
  std::vector<file_record_t> files;
};

/**
 * @brief keep fingerprints shared by at least two files
 */
std::vector<dupe_class_t> group_dupes(const fp_map_t &fp_map,
                                      const file_kind_t kind);

/**
 * @brief concatenate classes of both kinds for retention
 */
std::vector<dupe_class_t> merge_dupes(std::vector<dupe_class_t> image_dupes,
                                      std::vector<dupe_class_t> generic_dupes);

/**
 * @brief sum of class sizes
 */
std::size_t count_files(const std::vector<dupe_class_t> &dupes) noexcept;

}  // namespace detail_v1

}  // namespace declutter
