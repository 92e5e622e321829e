#pragma once

#include <string_view>
#include <vector>

#include "file_entry.hh"

namespace declutter {

inline namespace detail_v1 {

// which member of a duplicate class survives
enum class keep_t {
  oldest,         // min created time
  newest,         // max created time
  largest,        // max size
  smallest,       // min size
  shortest_path,  // min path length
  longest_path    // max path length
};

/**
 * @brief parse strategy token, unknown tokens fall back to oldest
 */
keep_t parse_keep(std::string_view token) noexcept;

std::string_view to_string(const keep_t keep) noexcept;

/**
 * @brief stable sort so that the survivor comes first
 */
void order_class(std::vector<file_record_t> &files, const keep_t keep);

}  // namespace detail_v1

}  // namespace declutter
