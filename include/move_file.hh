#pragma once

#include <filesystem>

namespace declutter {

inline namespace detail_v1 {

/**
 * @brief rename src to dst, copy then delete across filesystems keeping the
 * modification time. A failed copy leaves nothing at dst.
 * dst must not exist, it is never overwritten.
 *
 * @return false if nothing was moved, the failure is logged
 */
bool move_file(const std::filesystem::path &src,
               const std::filesystem::path &dst) noexcept;

}  // namespace detail_v1

}  // namespace declutter
