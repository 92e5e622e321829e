#include "move_file.hh"

#include <exception>
#include <system_error>

#include "log.hh"

namespace declutter {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

// drop a copy we created, it would block the name on later runs
void discard_copy(const fs::path &dst) noexcept {
  std::error_code ec;
  fs::remove(dst, ec);
  if (ec) {
    log_err() << "failed to remove copy: " << dst << " - " << ec.message();
  }
}

// copy with the modification time kept, nothing left at dst on failure
bool copy_across(const fs::path &src, const fs::path &dst) noexcept {
  std::error_code ec;
  fs::copy_file(src, dst, fs::copy_options::none, ec);
  if (ec) {
    log_warn() << "failed to copy: " << src << " - " << ec.message();
    if (ec != std::errc::file_exists) {
      discard_copy(dst);
    }
    return false;
  }

  const auto mtime = fs::last_write_time(src, ec);
  if (!ec) {
    fs::last_write_time(dst, mtime, ec);
  }
  if (ec) {
    log_warn() << "failed to keep mtime: " << src << " - " << ec.message();
    discard_copy(dst);
    return false;
  }
  return true;
}

}  // namespace

bool move_file(const fs::path &src, const fs::path &dst) noexcept {
  try {
    std::error_code ec;
    if (fs::exists(fs::symlink_status(dst, ec))) {
      log_warn() << "destination exists: " << dst;
      return false;
    }

    fs::rename(src, dst, ec);
    if (!ec) {
      return true;
    }
    if (ec != std::errc::cross_device_link) {
      log_warn() << "failed to move: " << src << " - " << ec.message();
      return false;
    }

    // different filesystem, copy then delete
    if (!copy_across(src, dst)) {
      return false;
    }
    if (!fs::remove(src, ec) || ec) {
      log_warn() << "failed to remove source: " << src << " - "
                 << (ec ? ec.message() : "doesn't exist");
      discard_copy(dst);
      return false;
    }
    return true;
  } catch (std::exception &e) {
    log_warn() << "failed to move: " << src << " - " << e.what();
    return false;
  }
}

}  // namespace detail_v1

}  // namespace declutter
