#pragma once

#include <atomic>
#include <iostream>
#include <optional>
#include <syncstream>

namespace declutter {

inline namespace detail_v1 {

enum class log_lv_t { err = 0, warn = 1, log = 2 };

// messages above this level are dropped
inline std::atomic<log_lv_t> log_level{log_lv_t::log};

/**
 * @brief one synchronized stderr line, emitted on destruction
 */
class log_line_t {
  std::optional<std::osyncstream> _os;

 public:
  explicit log_line_t(const log_lv_t lv) {
    if (lv > log_level.load(std::memory_order_relaxed)) {
      return;
    }
    _os.emplace(std::cerr);
    switch (lv) {
      case log_lv_t::err:
        *_os << "[err] ";
        break;
      case log_lv_t::warn:
        *_os << "[warn] ";
        break;
      case log_lv_t::log:
        *_os << "[log] ";
        break;
    }
  }

  log_line_t(const log_line_t &) = delete;
  log_line_t(log_line_t &&) = delete;
  log_line_t &operator=(const log_line_t &) = delete;
  log_line_t &operator=(log_line_t &&) = delete;

  ~log_line_t() {
    if (_os) {
      *_os << '\n';
    }
  }

  template <typename Tp>
  inline log_line_t &operator<<(const Tp &val) {
    if (_os) {
      *_os << val;
    }
    return *this;
  }
};

inline log_line_t log_err() { return log_line_t(log_lv_t::err); }
inline log_line_t log_warn() { return log_line_t(log_lv_t::warn); }
inline log_line_t log_info() { return log_line_t(log_lv_t::log); }

}  // namespace detail_v1

}  // namespace declutter
