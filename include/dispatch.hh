#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>

#include "file_entry.hh"
#include "fingerprint.hh"

namespace declutter {

inline namespace detail_v1 {

// (finished, total), called on the coordinating thread only
using progress_fn = std::function<void(std::size_t, std::size_t)>;

/**
 * @brief min(max_hash_workers, hardware concurrency), at least 1
 */
uint32_t default_threads() noexcept;

// 0 means default_threads(), anything else is capped at max_hash_workers
uint32_t clamp_threads(const uint32_t max_thread) noexcept;

/**
 * @brief fingerprint every entry on a bounded worker pool
 *
 * Workers only hash, each into its own slot. Results are merged into the
 * per-kind maps by the calling thread as they complete. Failed entries are
 * dropped.
 *
 * @param entries listed entries
 * @param md digest for generic files
 * @param max_thread pool size, see clamp_threads()
 * @param progress optional progress callback
 */
fp_table_t dispatch(std::span<const dir_entry_t> entries, const EVP_MD *md,
                    uint32_t max_thread, const progress_fn &progress = {});

}  // namespace detail_v1

}  // namespace declutter
