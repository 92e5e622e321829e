#include "ls_dir_rec.hh"

#include <sys/stat.h>

#include <chrono>
#include <system_error>

#include "log.hh"

namespace declutter {

inline namespace detail_v1 {

namespace {

time_point_t to_time_point(const struct timespec &ts) {
  auto since_epoch =
      std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
  return time_point_t(
      std::chrono::duration_cast<time_point_t::duration>(since_epoch));
}

}  // namespace

std::optional<dir_entry_t> stat_entry(const std::filesystem::path &path) {
  struct stat st {};
  if (::lstat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    return std::nullopt;
  }
  return dir_entry_t(path, static_cast<uint64_t>(st.st_size),
                     to_time_point(st.st_ctim), to_time_point(st.st_mtim));
}

void ls_dir_rec(const std::filesystem::path &dir,
                std::vector<dir_entry_t> &entries) {
  std::vector<std::filesystem::path> sub_dirs;
  try {
    for (const auto &dir_entry : std::filesystem::directory_iterator(dir)) {
      std::error_code ec;
      if (dir_entry.is_symlink(ec)) {
        // symlink, skip
        log_info() << "skip symlink: " << dir_entry.path();

      } else if (dir_entry.is_directory(ec)) {
        // directory, visit after this level is listed
        sub_dirs.emplace_back(dir_entry.path());

      } else if (dir_entry.is_regular_file(ec)) {
        // regular file, snapshot without following links
        auto entry = stat_entry(dir_entry.path());
        if (entry) {
          entries.emplace_back(std::move(*entry));
        } else {
          log_warn() << "skip file: " << dir_entry.path();
        }

      } else {
        // other file type, skip
        log_info() << "skip unsupport file: " << dir_entry.path();
      }
    }
  } catch (std::filesystem::filesystem_error &e) {
    // error iterate directory, skip the rest of it
    log_warn() << "skip directory: " << dir << " - " << e.code().message();
  }

  for (const auto &sub_dir : sub_dirs) {
    ls_dir_rec(sub_dir, entries);
  }
}

}  // namespace detail_v1

}  // namespace declutter
