#include "local_time.hh"

#include <array>
#include <chrono>
#include <ctime>

namespace declutter {

inline namespace detail_v1 {

std::string format_local(const time_point_t when, const char *fmt) {
  const std::time_t tt = std::chrono::system_clock::to_time_t(when);
  std::tm tm{};
  if (::localtime_r(&tt, &tm) == nullptr) {
    return {};
  }
  std::array<char, 64> buf{};
  const auto len = std::strftime(buf.data(), buf.size(), fmt, &tm);
  return std::string(buf.data(), len);
}

}  // namespace detail_v1

}  // namespace declutter
