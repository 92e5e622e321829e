#include "resolve.hh"

#include <optional>
#include <system_error>

#include "config.hh"
#include "local_time.hh"
#include "log.hh"
#include "move_file.hh"

namespace declutter {

inline namespace detail_v1 {

namespace fs = std::filesystem;

std::string quarantine_name(const time_point_t when) {
  return std::string(quarantine_prefix) + format_local(when, "%Y%m%d_%H%M%S");
}

resolve_t DECLUTTER_EXPORT resolve_dupes(std::vector<dupe_class_t> dupes,
                                         const keep_t keep,
                                         const fs::path &parent,
                                         const time_point_t when) {
  resolve_t result;
  result.quarantine_dir = parent / quarantine_name(when);

  // created once, on first use
  std::optional<bool> dir_ready;
  auto ensure_dir = [&]() {
    if (!dir_ready) {
      std::error_code ec;
      fs::create_directories(result.quarantine_dir, ec);
      dir_ready = !ec;
      if (ec) {
        log_err() << "failed to create quarantine folder: "
                  << result.quarantine_dir << " - " << ec.message();
      }
    }
    return *dir_ready;
  };

  for (auto &dupe : dupes) {
    if (dupe.files.size() < 2) {
      continue;
    }
    order_class(dupe.files, keep);
    // first one survives
    for (auto itr = dupe.files.begin() + 1; itr != dupe.files.end(); ++itr) {
      if (!ensure_dir()) {
        continue;
      }
      const auto dst = result.quarantine_dir / itr->path().filename();
      std::error_code ec;
      if (fs::exists(fs::symlink_status(dst, ec))) {
        // never rename or overwrite, leave candidate in place
        log_info() << "name taken, keep in place: " << itr->path();
        continue;
      }
      if (move_file(itr->path(), dst)) {
        ++result.moved_cnt;
        result.moved_bytes += itr->size();
        result.moved.push_back(*itr);
      }
    }
  }

  return result;
}

}  // namespace detail_v1

}  // namespace declutter
