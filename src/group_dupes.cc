#include "group_dupes.hh"

#include <iterator>

namespace declutter {

inline namespace detail_v1 {

std::vector<dupe_class_t> group_dupes(const fp_map_t &fp_map,
                                      const file_kind_t kind) {
  std::vector<dupe_class_t> dupes;
  for (const auto &[fingerprint, files] : fp_map) {
    if (files.size() > 1) {
      dupes.push_back({kind, fingerprint, files});
    }
  }
  return dupes;
}

std::vector<dupe_class_t> merge_dupes(std::vector<dupe_class_t> image_dupes,
                                      std::vector<dupe_class_t> generic_dupes) {
  image_dupes.insert(image_dupes.end(),
                     std::make_move_iterator(generic_dupes.begin()),
                     std::make_move_iterator(generic_dupes.end()));
  return image_dupes;
}

std::size_t count_files(const std::vector<dupe_class_t> &dupes) noexcept {
  std::size_t cnt = 0;
  for (const auto &dupe : dupes) {
    cnt += dupe.files.size();
  }
  return cnt;
}

}  // namespace detail_v1

}  // namespace declutter
