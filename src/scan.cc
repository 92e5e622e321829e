#include "scan.hh"

#include <initializer_list>
#include <stdexcept>
#include <system_error>

#include "digest.hh"
#include "log.hh"
#include "ls_dir_rec.hh"
#include "stopwatch.hh"

namespace declutter {

inline namespace detail_v1 {

void check_dir(const std::filesystem::path &dir) {
  std::error_code ec;
  if (dir.empty() || !std::filesystem::is_directory(dir, ec)) {
    throw std::invalid_argument("invalid target directory: " + dir.string());
  }
}

scan_result_t DECLUTTER_EXPORT scan(const std::filesystem::path &dir,
                                    uint32_t max_thread,
                                    const std::string &algo,
                                    const progress_fn &progress) {
  check_dir(dir);
  const EVP_MD *md = digest_by_name(algo);
  max_thread = clamp_threads(max_thread);

  // generate file list
  stopwatch_t stopwatch;
  log_info() << "list files...";
  const auto entries = ls_dir_rec(dir);
  stopwatch.log_lap("listing");
  log_info() << "file count: " << entries.size();

  // fingerprint
  log_info() << "hash files with " << max_thread << " threads...";
  const auto table = dispatch(entries, md, max_thread, progress);
  stopwatch.log_lap("hashing");

  // keep shared fingerprints only
  scan_result_t result;
  result.image_dupes = group_dupes(table.image, file_kind_t::image);
  result.generic_dupes = group_dupes(table.generic, file_kind_t::generic);
  for (const auto &dupes : {&result.image_dupes, &result.generic_dupes}) {
    if (!dupes->empty()) {
      log_info() << to_string(dupes->front().kind)
                 << " duplicate group count: " << dupes->size();
    }
  }

  return result;
}

}  // namespace detail_v1

}  // namespace declutter
