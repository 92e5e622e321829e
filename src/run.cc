#include "run.hh"

#include <chrono>
#include <vector>

#include "audit_log.hh"
#include "digest.hh"
#include "group_dupes.hh"
#include "log.hh"
#include "scan.hh"
#include "stopwatch.hh"

namespace declutter {

inline namespace detail_v1 {

namespace {

inline bool cancelled(const std::atomic<bool> &cancel) {
  if (cancel.load()) {
    log_info() << "cancelled";
    return true;
  }
  return false;
}

}  // namespace

std::optional<job_t> parse_job(std::string_view token) noexcept {
  if (token == "dedupe" || token == "deduplicate") {
    return job_t::dedupe;
  }
  if (token == "organize") {
    return job_t::organize;
  }
  if (token == "both") {
    return job_t::both;
  }
  return std::nullopt;
}

run_result_t DECLUTTER_EXPORT run(const run_opts_t &opts,
                                  const std::atomic<bool> &cancel) {
  // fail before touching anything
  check_dir(opts.dir);
  digest_by_name(opts.algo);

  stopwatch_t stopwatch;
  run_result_t result;

  if (opts.job == job_t::dedupe || opts.job == job_t::both) {
    if (cancelled(cancel)) {
      result.status = run_status_t::cancelled;
      return result;
    }
    log_info() << "detect duplicates in " << opts.dir;
    auto scanned = scan(opts.dir, opts.max_thread, opts.algo, opts.progress);
    if (cancelled(cancel)) {
      result.status = run_status_t::cancelled;
      return result;
    }

    auto dupes = merge_dupes(std::move(scanned.image_dupes),
                             std::move(scanned.generic_dupes));
    result.dupe_files = count_files(dupes);
    result.dupe_groups = dupes.size();
    if (!dupes.empty()) {
      const auto now = std::chrono::system_clock::now();
      const auto parent = opts.quarantine_parent.empty()
                              ? std::filesystem::current_path()
                              : opts.quarantine_parent;
      result.resolved =
          resolve_dupes(std::move(dupes), opts.keep, parent, now);
      log_info() << "moved " << result.resolved->moved_cnt << " files to "
                 << result.resolved->quarantine_dir;
      if (!opts.log_path.empty()) {
        result.audit_ok =
            write_audit_log(opts.log_path, opts.dir, *result.resolved, now);
      }
    } else {
      log_info() << "no duplicate found";
    }
    stopwatch.log_lap("deduplicate");
  }

  if (opts.job == job_t::organize || opts.job == job_t::both) {
    if (cancelled(cancel)) {
      result.status = run_status_t::cancelled;
      return result;
    }
    log_info() << "classify images by " << to_string(opts.bucket);
    std::vector<std::filesystem::path> skip_dirs;
    if (result.resolved) {
      skip_dirs.push_back(result.resolved->quarantine_dir);
    }
    result.classified = classify(opts.dir, opts.bucket, skip_dirs);
    stopwatch.log_lap("classify");
  }

  log_info() << "elapsed: " << stopwatch.total().count() << "ms";
  return result;
}

}  // namespace detail_v1

}  // namespace declutter
