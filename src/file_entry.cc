#include "file_entry.hh"

#include <algorithm>
#include <cctype>

#include "config.hh"

namespace declutter {

inline namespace detail_v1 {

file_kind_t kind_of(const std::filesystem::path &path) {
  // suffix of the whole name, so ".png" itself counts
  auto name = path.filename().string();
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  for (const auto &image_ext : image_exts) {
    if (name.ends_with(image_ext)) {
      return file_kind_t::image;
    }
  }
  return file_kind_t::generic;
}

std::string_view to_string(const file_kind_t kind) noexcept {
  return kind == file_kind_t::image ? "image" : "generic";
}

}  // namespace detail_v1

}  // namespace declutter
