#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "classify.hh"
#include "config.hh"
#include "dispatch.hh"
#include "keep.hh"
#include "resolve.hh"

namespace declutter {

inline namespace detail_v1 {

enum class job_t {
  dedupe,    // quarantine duplicates only
  organize,  // classify images only
  both       // dedupe, then classify what is left
};

/**
 * @brief nullopt for unknown tokens
 */
std::optional<job_t> parse_job(std::string_view token) noexcept;

struct run_opts_t {
  std::filesystem::path dir;
  job_t job = job_t::organize;
  keep_t keep = keep_t::oldest;
  bucket_t bucket = bucket_t::date;
  // 0 means default_threads()
  uint32_t max_thread = 0;
  std::string algo = std::string(default_digest);
  // quarantine folder is created here, current directory if empty
  std::filesystem::path quarantine_parent;
  // audit log of moved duplicates, none if empty
  std::filesystem::path log_path;
  progress_fn progress;
};

enum class run_status_t { done, cancelled };

struct run_result_t {
  run_status_t status = run_status_t::done;
  // members of all duplicate classes, and number of classes
  std::size_t dupe_files = 0;
  std::size_t dupe_groups = 0;
  std::optional<resolve_t> resolved;
  std::optional<classify_t> classified;
  bool audit_ok = true;
};

/**
 * @brief run the selected job, cancel is checked between phases only
 *
 * @throws std::invalid_argument if opts.dir is not a directory or the digest
 * is unknown, before anything is touched
 */
run_result_t run(const run_opts_t &opts, const std::atomic<bool> &cancel);

}  // namespace detail_v1

}  // namespace declutter
