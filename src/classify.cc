#include "classify.hh"

#include <charconv>
#include <iterator>
#include <system_error>
#include <unordered_map>
#include <utility>

#include "config.hh"
#include "exif_date.hh"
#include "file_entry.hh"
#include "local_time.hh"
#include "log.hh"
#include "ls_dir_rec.hh"
#include "move_file.hh"
#include "scan.hh"

namespace declutter {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

using key_fn_t = std::function<std::optional<std::string>(std::string_view)>;

std::optional<int> parse_int(std::string_view str) {
  int val = 0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), val);
  if (ec != std::errc() || ptr != str.data() + str.size()) {
    return std::nullopt;
  }
  return val;
}

// date folder name -> created folder, nullopt if creation failed
class folder_memo_t {
  fs::path _root;
  std::unordered_map<std::string, std::optional<fs::path>> _folders;

 public:
  explicit folder_memo_t(fs::path root) : _root(std::move(root)) {}

  const std::optional<fs::path> &get(const std::string &key) {
    auto itr = _folders.find(key);
    if (itr != _folders.end()) {
      return itr->second;
    }
    auto folder = _root / key;
    std::error_code ec;
    fs::create_directories(folder, ec);
    if (ec) {
      log_warn() << "failed to create folder: " << folder << " - "
                 << ec.message();
      return _folders.emplace(key, std::nullopt).first->second;
    }
    return _folders.emplace(key, std::move(folder)).first->second;
  }
};

// lexical containment, both sides made absolute
bool is_under(const fs::path &path, const fs::path &dir) {
  std::error_code ec;
  const auto abs_path = fs::absolute(path, ec).lexically_normal();
  const auto abs_dir = fs::absolute(dir, ec).lexically_normal();
  if (ec) {
    return false;
  }
  const auto rel = abs_path.lexically_relative(abs_dir);
  return !rel.empty() && *rel.begin() != "..";
}

bool in_quarantine(const fs::path &root, const fs::path &path,
                   const std::vector<fs::path> &skip_dirs) {
  const auto rel = path.lexically_relative(root);
  auto itr = rel.begin();
  if (itr != rel.end() && std::next(itr) != rel.end() &&
      itr->string().starts_with(quarantine_prefix)) {
    return true;
  }
  for (const auto &skip_dir : skip_dirs) {
    if (is_under(path, skip_dir)) {
      return true;
    }
  }
  return false;
}

std::optional<std::string> date_key(std::string_view date) {
  if (date.empty()) {
    return std::nullopt;
  }
  return std::string(date);
}

key_fn_t key_fn_for(const bucket_t bucket) {
  return bucket == bucket_t::quarter ? key_fn_t(quarter_key)
                                     : key_fn_t(date_key);
}

}  // namespace

bucket_t parse_bucket(std::string_view token) noexcept {
  return token == "quarter" ? bucket_t::quarter : bucket_t::date;
}

std::string_view to_string(const bucket_t bucket) noexcept {
  return bucket == bucket_t::quarter ? "quarter" : "date";
}

std::optional<std::string> quarter_key(std::string_view date) {
  const auto first = date.find('-');
  const auto second = date.find('-', first + 1);
  if (first == std::string_view::npos || second == std::string_view::npos) {
    return std::nullopt;
  }
  auto year = parse_int(date.substr(0, first));
  auto month = parse_int(date.substr(first + 1, second - first - 1));
  if (!year || !month || *month < 1 || *month > 12) {
    return std::nullopt;
  }
  const auto quarter = (*month - 1) / 3 + 1;
  return std::string(date.substr(0, first)) + "-Q" + std::to_string(quarter);
}

std::optional<std::string> bucket_key(std::string_view date,
                                      const bucket_t bucket) {
  return key_fn_for(bucket)(date);
}

classify_t DECLUTTER_EXPORT classify(const fs::path &dir,
                                     const bucket_t bucket,
                                     const std::vector<fs::path> &skip_dirs) {
  check_dir(dir);

  // snapshot first, created folders are never walked again
  auto entries = ls_dir_rec(dir);
  folder_memo_t folders(dir);
  const auto key_fn = key_fn_for(bucket);
  classify_t tally;

  for (const auto &entry : entries) {
    if (kind_of(entry.path()) != file_kind_t::image ||
        in_quarantine(dir, entry.path(), skip_dirs)) {
      continue;
    }
    ++tally.total;

    auto date = read_exif_date(entry.path());
    if (!date) {
      date = format_local(entry.mtime(), "%Y-%m-%d");
    }
    auto key = key_fn(*date);
    if (!key) {
      ++tally.skipped;
      continue;
    }
    const auto &folder = folders.get(*key);
    if (!folder) {
      ++tally.skipped;
      continue;
    }

    const auto dst = *folder / entry.path().filename();
    std::error_code ec;
    if (fs::exists(fs::symlink_status(dst, ec))) {
      // name taken, never overwrite
      ++tally.skipped;
      continue;
    }
    if (move_file(entry.path(), dst)) {
      ++tally.organized;
    } else {
      ++tally.skipped;
    }
  }

  log_info() << "images: " << tally.total << ", organized: " << tally.organized
             << ", skipped: " << tally.skipped;
  return tally;
}

}  // namespace detail_v1

}  // namespace declutter
