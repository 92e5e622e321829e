#pragma once

#include <openssl/evp.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "file_entry.hh"

namespace declutter {

inline namespace detail_v1 {

// fingerprint -> files sharing it
using fp_map_t = std::unordered_map<std::string, std::vector<file_record_t>>;

struct fp_table_t {
  fp_map_t image;
  fp_map_t generic;
};

/**
 * @brief fingerprint one listed entry, perceptual hash for images and
 * content digest otherwise
 *
 * @return nullopt for empty files and any read or decode failure
 */
std::optional<file_record_t> make_record(const dir_entry_t &entry,
                                         const EVP_MD *md);

}  // namespace detail_v1

}  // namespace declutter
