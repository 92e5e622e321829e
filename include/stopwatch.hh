#pragma once

#include <chrono>
#include <string_view>

#include "log.hh"

namespace declutter {

inline namespace detail_v1 {

// lap timer for phase logging
class stopwatch_t {
  std::chrono::steady_clock::time_point _start;
  std::chrono::steady_clock::time_point _prev_time;

 public:
  stopwatch_t() noexcept
      : _start(std::chrono::steady_clock::now()), _prev_time(_start) {}

  std::chrono::milliseconds lap() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }

  std::chrono::milliseconds total() const noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - _start);
  }

  // "[log] <phase> took Nms", restarts the lap
  std::chrono::milliseconds log_lap(std::string_view phase) {
    const auto duration = lap();
    log_info() << phase << " took " << duration.count() << "ms";
    return duration;
  }
};

}  // namespace detail_v1

}  // namespace declutter
