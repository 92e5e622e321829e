#include "keep.hh"

#include <algorithm>
#include <array>
#include <utility>

namespace declutter {

inline namespace detail_v1 {

namespace {

constexpr std::array<std::pair<std::string_view, keep_t>, 6> keep_names = {{
    {"oldest", keep_t::oldest},
    {"newest", keep_t::newest},
    {"largest", keep_t::largest},
    {"smallest", keep_t::smallest},
    {"shortest_path", keep_t::shortest_path},
    {"longest_path", keep_t::longest_path},
}};

inline auto path_len(const file_record_t &file) {
  return file.path().native().size();
}

}  // namespace

keep_t parse_keep(std::string_view token) noexcept {
  for (const auto &[name, keep] : keep_names) {
    if (name == token) {
      return keep;
    }
  }
  return keep_t::oldest;
}

std::string_view to_string(const keep_t keep) noexcept {
  for (const auto &[name, value] : keep_names) {
    if (value == keep) {
      return name;
    }
  }
  return "oldest";
}

void order_class(std::vector<file_record_t> &files, const keep_t keep) {
  auto sort_by = [&files](auto &&less) {
    std::stable_sort(files.begin(), files.end(), less);
  };
  switch (keep) {
    case keep_t::oldest:
      sort_by([](const auto &a, const auto &b) { return a.ctime() < b.ctime(); });
      break;
    case keep_t::newest:
      sort_by([](const auto &a, const auto &b) { return a.ctime() > b.ctime(); });
      break;
    case keep_t::largest:
      sort_by([](const auto &a, const auto &b) { return a.size() > b.size(); });
      break;
    case keep_t::smallest:
      sort_by([](const auto &a, const auto &b) { return a.size() < b.size(); });
      break;
    case keep_t::shortest_path:
      sort_by([](const auto &a, const auto &b) {
        return path_len(a) < path_len(b);
      });
      break;
    case keep_t::longest_path:
      sort_by([](const auto &a, const auto &b) {
        return path_len(a) > path_len(b);
      });
      break;
  }
}

}  // namespace detail_v1

}  // namespace declutter
