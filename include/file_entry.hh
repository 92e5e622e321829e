#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace declutter {

inline namespace detail_v1 {

using time_point_t = std::chrono::system_clock::time_point;

enum class file_kind_t { image, generic };

/**
 * @brief classify by name suffix only, case-insensitive
 */
file_kind_t kind_of(const std::filesystem::path &path);

std::string_view to_string(const file_kind_t kind) noexcept;

/**
 * @brief listed entry with a lstat snapshot, symlinks are never followed
 */
class dir_entry_t {
  std::filesystem::path _path;
  uint64_t _size = 0;
  time_point_t _ctime;
  time_point_t _mtime;

 public:
  template <typename Tp>
  inline dir_entry_t(Tp &&path, const uint64_t size, const time_point_t ctime,
                     const time_point_t mtime)
      : _path(std::forward<Tp>(path)),
        _size(size),
        _ctime(ctime),
        _mtime(mtime) {}

  inline dir_entry_t(const dir_entry_t &rhs) = default;
  inline dir_entry_t(dir_entry_t &&rhs) = default;
  inline dir_entry_t &operator=(const dir_entry_t &rhs) = default;
  inline dir_entry_t &operator=(dir_entry_t &&rhs) = default;

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t size() const noexcept { return _size; }
  inline time_point_t ctime() const noexcept { return _ctime; }
  inline time_point_t mtime() const noexcept { return _mtime; }
};

/**
 * @brief fingerprinted non-empty file
 *
 * created time is the inode change time, only used as a sort key
 */
class file_record_t {
  std::filesystem::path _path;
  uint64_t _size = 0;
  time_point_t _ctime;
  time_point_t _mtime;
  std::string _fingerprint;
  file_kind_t _kind = file_kind_t::generic;

 public:
  template <typename Tp>
  inline file_record_t(Tp &&path, const uint64_t size,
                       const time_point_t ctime, const time_point_t mtime,
                       std::string fingerprint, const file_kind_t kind)
      : _path(std::forward<Tp>(path)),
        _size(size),
        _ctime(ctime),
        _mtime(mtime),
        _fingerprint(std::move(fingerprint)),
        _kind(kind) {}

  inline file_record_t(const file_record_t &rhs) = default;
  inline file_record_t(file_record_t &&rhs) = default;
  inline file_record_t &operator=(const file_record_t &rhs) = default;
  inline file_record_t &operator=(file_record_t &&rhs) = default;

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t size() const noexcept { return _size; }
  inline time_point_t ctime() const noexcept { return _ctime; }
  inline time_point_t mtime() const noexcept { return _mtime; }
  inline const std::string &fingerprint() const noexcept {
    return _fingerprint;
  }
  inline file_kind_t kind() const noexcept { return _kind; }
};

}  // namespace detail_v1

}  // namespace declutter
