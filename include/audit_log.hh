#pragma once

#include <filesystem>
#include <ostream>
#include <string>

#include "file_entry.hh"
#include "resolve.hh"

namespace declutter {

inline namespace detail_v1 {

// duplicate_files_log_<YYYYMMDD_HHMMSS>.txt
std::string audit_log_name(const time_point_t when);

/**
 * @brief plain text report of one dedupe pass: run time, scanned directory,
 * moved count and bytes, quarantine folder, then one moved source per line
 */
void write_audit_log(std::ostream &os, const std::filesystem::path &root,
                     const resolve_t &resolved, const time_point_t when);

/**
 * @brief write the report to a file, truncating it
 *
 * @return false if the file can not be written
 */
bool write_audit_log(const std::filesystem::path &log_path,
                     const std::filesystem::path &root,
                     const resolve_t &resolved, const time_point_t when);

}  // namespace detail_v1

}  // namespace declutter
