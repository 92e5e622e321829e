#include "audit_log.hh"

#include <fstream>

#include "config.hh"
#include "local_time.hh"
#include "log.hh"

namespace declutter {

inline namespace detail_v1 {

std::string audit_log_name(const time_point_t when) {
  return std::string(audit_log_prefix) + format_local(when, "%Y%m%d_%H%M%S") +
         ".txt";
}

void write_audit_log(std::ostream &os, const std::filesystem::path &root,
                     const resolve_t &resolved, const time_point_t when) {
  os << "run time: " << format_local(when, "%Y-%m-%d %H:%M:%S") << '\n'
     << "scanned directory: " << root.string() << '\n'
     << "moved files: " << resolved.moved_cnt << '\n'
     << "moved bytes: " << resolved.moved_bytes << '\n'
     << "quarantine folder: " << resolved.quarantine_dir.string() << '\n'
     << "moved sources:\n";
  for (const auto &file : resolved.moved) {
    os << file.path().string() << '\n';
  }
}

bool DECLUTTER_EXPORT write_audit_log(const std::filesystem::path &log_path,
                                      const std::filesystem::path &root,
                                      const resolve_t &resolved,
                                      const time_point_t when) {
  std::ofstream log_file(log_path, std::ios::out | std::ios::trunc);
  if (!log_file.is_open() || !log_file.good()) {
    log_err() << "error opening logfile: " << log_path;
    return false;
  }
  write_audit_log(log_file, root, resolved, when);
  log_file.flush();
  if (!log_file.good()) {
    log_err() << "error writing logfile: " << log_path;
    return false;
  }
  return true;
}

}  // namespace detail_v1

}  // namespace declutter
