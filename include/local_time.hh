#pragma once

#include <string>

#include "file_entry.hh"

namespace declutter {

inline namespace detail_v1 {

/**
 * @brief strftime in the local time zone
 *
 * @param when time to format
 * @param fmt strftime format, e.g. "%Y-%m-%d"
 * @return empty string if the time can not be converted
 */
std::string format_local(const time_point_t when, const char *fmt);

}  // namespace detail_v1

}  // namespace declutter
