#include "fingerprint.hh"

#include "digest.hh"
#include "phash.hh"

namespace declutter {

inline namespace detail_v1 {

std::optional<file_record_t> make_record(const dir_entry_t &entry,
                                         const EVP_MD *md) {
  if (entry.size() == 0) {
    return std::nullopt;
  }

  const auto kind = kind_of(entry.path());
  auto fingerprint = kind == file_kind_t::image
                         ? image_phash(entry.path())
                         : file_digest(entry.path(), md);
  if (!fingerprint) {
    return std::nullopt;
  }

  return file_record_t(entry.path(), entry.size(), entry.ctime(),
                       entry.mtime(), std::move(*fingerprint), kind);
}

}  // namespace detail_v1

}  // namespace declutter
