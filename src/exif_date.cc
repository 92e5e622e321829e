#include "exif_date.hh"

#include <array>
#include <cstring>
#include <fstream>
#include <initializer_list>
#include <string_view>
#include <system_error>
#include <vector>

#include "config.hh"

namespace declutter {

inline namespace detail_v1 {

namespace {

constexpr uint16_t tag_exif_ifd = 0x8769;
constexpr uint16_t tag_date_time_original = 0x9003;
constexpr uint16_t type_ascii = 2;
constexpr std::size_t date_len = 19;  // "YYYY:MM:DD hh:mm:ss"

constexpr uint8_t jpeg_soi = 0xd8;
constexpr uint8_t jpeg_eoi = 0xd9;
constexpr uint8_t jpeg_sos = 0xda;
constexpr uint8_t jpeg_app1 = 0xe1;

// bounds checked reads in the block's byte order
class tiff_view_t {
  std::span<const uint8_t> _data;
  bool _le = true;

 public:
  tiff_view_t(std::span<const uint8_t> data, const bool le) noexcept
      : _data(data), _le(le) {}

  std::optional<uint16_t> u16(const std::size_t off) const noexcept {
    if (off + 2 > _data.size()) {
      return std::nullopt;
    }
    const uint16_t b0 = _data[off];
    const uint16_t b1 = _data[off + 1];
    return static_cast<uint16_t>(_le ? (b1 << 8) | b0 : (b0 << 8) | b1);
  }

  std::optional<uint32_t> u32(const std::size_t off) const noexcept {
    auto lo = u16(off);
    auto hi = u16(off + 2);
    if (!lo || !hi) {
      return std::nullopt;
    }
    return _le ? (uint32_t(*hi) << 16) | *lo : (uint32_t(*lo) << 16) | *hi;
  }

  std::optional<std::string_view> str(const std::size_t off,
                                      const std::size_t len) const noexcept {
    if (off + len > _data.size()) {
      return std::nullopt;
    }
    return std::string_view(reinterpret_cast<const char *>(&_data[off]), len);
  }
};

struct ifd_field_t {
  uint16_t type;
  uint32_t count;
  std::size_t value_off;  // offset of the 4 byte value/offset slot
};

std::optional<ifd_field_t> find_field(const tiff_view_t &tiff,
                                      const uint32_t ifd_off,
                                      const uint16_t tag) {
  auto entry_cnt = tiff.u16(ifd_off);
  if (!entry_cnt) {
    return std::nullopt;
  }
  for (auto i = 0U; i < *entry_cnt; ++i) {
    const std::size_t entry_off = ifd_off + 2UL + 12UL * i;
    auto entry_tag = tiff.u16(entry_off);
    auto entry_type = tiff.u16(entry_off + 2);
    auto entry_count = tiff.u32(entry_off + 4);
    if (!entry_tag || !entry_type || !entry_count) {
      return std::nullopt;
    }
    if (*entry_tag == tag) {
      return ifd_field_t{*entry_type, *entry_count, entry_off + 8};
    }
  }
  return std::nullopt;
}

inline bool is_digit(const char c) noexcept { return c >= '0' && c <= '9'; }

// "YYYY:MM:DD ..." -> "YYYY-MM-DD"
std::optional<std::string> to_iso_date(std::string_view raw) {
  if (raw.size() < 10 || raw[4] != ':' || raw[7] != ':') {
    return std::nullopt;
  }
  for (const auto pos : {0, 1, 2, 3, 5, 6, 8, 9}) {
    if (!is_digit(raw[pos])) {
      return std::nullopt;
    }
  }
  const auto month = (raw[5] - '0') * 10 + (raw[6] - '0');
  const auto day = (raw[8] - '0') * 10 + (raw[9] - '0');
  if (month < 1 || month > 12 || day < 1 || day > 31) {
    return std::nullopt;
  }
  std::string date(raw.substr(0, 10));
  date[4] = '-';
  date[7] = '-';
  return date;
}

std::optional<std::string> read_date_field(const tiff_view_t &tiff,
                                           const uint32_t ifd_off) {
  auto field = find_field(tiff, ifd_off, tag_date_time_original);
  if (!field || field->type != type_ascii || field->count < date_len) {
    return std::nullopt;
  }
  // more than 4 bytes, value slot holds the offset
  auto str_off = tiff.u32(field->value_off);
  if (!str_off) {
    return std::nullopt;
  }
  auto raw = tiff.str(*str_off, date_len);
  if (!raw) {
    return std::nullopt;
  }
  return to_iso_date(*raw);
}

std::optional<std::vector<uint8_t>> read_bytes(std::ifstream &ifs,
                                               const std::size_t len) {
  std::vector<uint8_t> buf(len);
  ifs.read(reinterpret_cast<char *>(buf.data()),
           static_cast<std::streamsize>(len));
  if (static_cast<std::size_t>(ifs.gcount()) != len) {
    return std::nullopt;
  }
  return buf;
}

std::optional<std::string> jpeg_exif_date(std::ifstream &ifs) {
  constexpr std::array<uint8_t, 6> exif_hdr = {'E', 'x', 'i', 'f', 0, 0};
  while (ifs) {
    auto marker = read_bytes(ifs, 2);
    if (!marker || (*marker)[0] != 0xff) {
      return std::nullopt;
    }
    const auto code = (*marker)[1];
    if (code == jpeg_eoi || code == jpeg_sos) {
      // no metadata past the scan header
      return std::nullopt;
    }
    if (code == 0x01 || (code >= 0xd0 && code <= 0xd7) || code == 0xff) {
      // standalone marker or fill byte
      if (code == 0xff) {
        ifs.seekg(-1, std::ios::cur);
      }
      continue;
    }
    auto len_bytes = read_bytes(ifs, 2);
    if (!len_bytes) {
      return std::nullopt;
    }
    const std::size_t seg_len =
        (std::size_t((*len_bytes)[0]) << 8) | (*len_bytes)[1];
    if (seg_len < 2) {
      return std::nullopt;
    }
    const auto body_len = seg_len - 2;
    if (code == jpeg_app1 && body_len > exif_hdr.size()) {
      auto body = read_bytes(ifs, body_len);
      if (!body) {
        return std::nullopt;
      }
      if (std::memcmp(body->data(), exif_hdr.data(), exif_hdr.size()) == 0) {
        return tiff_exif_date(
            std::span<const uint8_t>(*body).subspan(exif_hdr.size()));
      }
    } else {
      ifs.seekg(static_cast<std::streamoff>(body_len), std::ios::cur);
    }
  }
  return std::nullopt;
}

}  // namespace

std::optional<std::string> tiff_exif_date(std::span<const uint8_t> tiff) {
  if (tiff.size() < 8) {
    return std::nullopt;
  }
  bool le = false;
  if (tiff[0] == 'I' && tiff[1] == 'I') {
    le = true;
  } else if (tiff[0] != 'M' || tiff[1] != 'M') {
    return std::nullopt;
  }
  const tiff_view_t view(tiff, le);
  auto magic = view.u16(2);
  auto ifd0 = view.u32(4);
  if (!magic || *magic != 42 || !ifd0) {
    return std::nullopt;
  }

  // some writers keep it in IFD0
  if (auto date = read_date_field(view, *ifd0)) {
    return date;
  }
  auto exif_ptr = find_field(view, *ifd0, tag_exif_ifd);
  if (!exif_ptr) {
    return std::nullopt;
  }
  auto exif_ifd = view.u32(exif_ptr->value_off);
  if (!exif_ifd) {
    return std::nullopt;
  }
  return read_date_field(view, *exif_ifd);
}

std::optional<std::string> read_exif_date(const std::filesystem::path &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    return std::nullopt;
  }
  auto head = read_bytes(ifs, 4);
  if (!head) {
    return std::nullopt;
  }
  const auto &h = *head;
  if (h[0] == 0xff && h[1] == jpeg_soi) {
    ifs.seekg(2, std::ios::beg);
    return jpeg_exif_date(ifs);
  }
  const bool is_tiff = (h[0] == 'I' && h[1] == 'I' && h[2] == 42 && h[3] == 0) ||
                       (h[0] == 'M' && h[1] == 'M' && h[2] == 0 && h[3] == 42);
  if (!is_tiff) {
    return std::nullopt;
  }
  std::error_code ec;
  const auto file_sz = std::filesystem::file_size(path, ec);
  if (ec || file_sz > exif_tiff_max) {
    return std::nullopt;
  }
  ifs.seekg(0, std::ios::beg);
  auto whole = read_bytes(ifs, static_cast<std::size_t>(file_sz));
  if (!whole) {
    return std::nullopt;
  }
  return tiff_exif_date(*whole);
}

}  // namespace detail_v1

}  // namespace declutter
