#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace declutter {

inline namespace detail_v1 {

/**
 * @brief look up a digest supported by libcrypto
 *
 * @throws std::invalid_argument if the name is unknown
 */
const EVP_MD *digest_by_name(const std::string &name);

// RAII wrapper for EVP_MD_CTX
class digest_t {
  EVP_MD_CTX *_ctx;

 public:
  explicit digest_t(const EVP_MD *md);
  ~digest_t() noexcept;

  digest_t(const digest_t &rhs) = delete;
  digest_t(digest_t &&rhs) = delete;
  digest_t &operator=(const digest_t &rhs) = delete;
  digest_t &operator=(digest_t &&rhs) = delete;

  void update(const char *data, const std::size_t size);
  // lowercase hex
  std::string hex_digest();
};

/**
 * @brief stream file content through the digest in read_blk_sz blocks
 *
 * @return lowercase hex digest, nullopt on any I/O failure
 */
std::optional<std::string> file_digest(const std::filesystem::path &path,
                                       const EVP_MD *md);

/**
 * @brief lowercase hex encoding
 */
std::string to_hex(const unsigned char *data, const std::size_t size);

}  // namespace detail_v1

}  // namespace declutter
