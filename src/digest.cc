#include "digest.hh"

#include <array>
#include <fstream>
#include <stdexcept>

#include "config.hh"
#include "log.hh"

namespace declutter {

inline namespace detail_v1 {

const EVP_MD *digest_by_name(const std::string &name) {
  const EVP_MD *md = EVP_get_digestbyname(name.c_str());
  if (md == nullptr) {
    throw std::invalid_argument("invalid hash algorithm: " + name);
  }
  return md;
}

digest_t::digest_t(const EVP_MD *md) {
  _ctx = EVP_MD_CTX_new();
  if (_ctx == nullptr) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(_ctx, md, nullptr) != 1) {
    EVP_MD_CTX_free(_ctx);
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

digest_t::~digest_t() noexcept {
  if (_ctx != nullptr) {
    EVP_MD_CTX_free(_ctx);
  }
}

void digest_t::update(const char *data, const std::size_t size) {
  if (EVP_DigestUpdate(_ctx, data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

std::string digest_t::hex_digest() {
  std::array<unsigned char, EVP_MAX_MD_SIZE> md_val{};
  unsigned int md_len = 0;
  if (EVP_DigestFinal_ex(_ctx, md_val.data(), &md_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  return to_hex(md_val.data(), md_len);
}

std::string to_hex(const unsigned char *data, const std::size_t size) {
  constexpr char hex_chars[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    hex += hex_chars[data[i] >> 4];
    hex += hex_chars[data[i] & 0x0f];
  }
  return hex;
}

std::optional<std::string> file_digest(const std::filesystem::path &path,
                                       const EVP_MD *md) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    log_warn() << "open failed: " << path;
    return std::nullopt;
  }
  try {
    digest_t digest(md);
    std::array<char, read_blk_sz> buf;
    while (ifs) {
      ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
      const auto read_len = ifs.gcount();
      if (read_len > 0) {
        digest.update(buf.data(), static_cast<std::size_t>(read_len));
      }
    }
    if (ifs.bad()) {
      log_warn() << "read error: " << path;
      return std::nullopt;
    }
    return digest.hex_digest();
  } catch (const std::runtime_error &e) {
    log_err() << e.what() << ": " << path;
    return std::nullopt;
  }
}

}  // namespace detail_v1

}  // namespace declutter
