/**
 * @file test_exif_date.cc
 * @brief capture date from JPEG APP1 and bare TIFF headers
 */

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "exif_date.hh"
#include "test_util.hh"

namespace declutter::test {

class ExifDateTest : public scratch_test_t {};

TEST_F(ExifDateTest, LittleEndianIfd0) {
  const auto path =
      create_file("le.jpg", exif_jpeg("2023:07:14 10:20:30", true));
  EXPECT_EQ(read_exif_date(path).value_or(""), "2023-07-14");
}

TEST_F(ExifDateTest, BigEndianIfd0) {
  const auto path =
      create_file("be.jpg", exif_jpeg("2023:07:14 10:20:30", false));
  EXPECT_EQ(read_exif_date(path).value_or(""), "2023-07-14");
}

TEST_F(ExifDateTest, NestedExifIfd) {
  const auto le = create_file("n_le.jpg", exif_jpeg("2019:12:31 23:59:59", true, true));
  const auto be = create_file("n_be.jpg", exif_jpeg("2019:12:31 23:59:59", false, true));
  EXPECT_EQ(read_exif_date(le).value_or(""), "2019-12-31");
  EXPECT_EQ(read_exif_date(be).value_or(""), "2019-12-31");
}

TEST_F(ExifDateTest, BareTiff) {
  auto jpeg = exif_jpeg("2001:02:03 04:05:06", true);
  // drop SOI, APP1 marker, length and Exif header
  const std::vector<uint8_t> tiff(jpeg.begin() + 12, jpeg.end() - 2);
  const auto path = create_file("raw.tiff", tiff);
  EXPECT_EQ(read_exif_date(path).value_or(""), "2001-02-03");
  EXPECT_EQ(tiff_exif_date(tiff).value_or(""), "2001-02-03");
}

TEST_F(ExifDateTest, MalformedDateIsAbsent) {
  for (const std::string raw : {"2023:13:01 00:00:00", "2023:00:10 00:00:00",
                                "2023:01:32 00:00:00", "20x3:01:01 00:00:00",
                                "2023-01-01 00:00:00", "0000:00:00 00:00:00"}) {
    const auto path = create_file("bad.jpg", exif_jpeg(raw, true));
    EXPECT_FALSE(read_exif_date(path)) << raw;
  }
}

TEST_F(ExifDateTest, NoMetadata) {
  create_image("plain.png", gradient());
  EXPECT_FALSE(read_exif_date(root / "plain.png"));
  const auto jpg = create_file("short.jpg", std::vector<uint8_t>{0xff, 0xd8, 0xff, 0xd9});
  EXPECT_FALSE(read_exif_date(jpg));
  EXPECT_FALSE(read_exif_date(root / "missing.jpg"));
}

TEST_F(ExifDateTest, TruncatedTiffIsRejected) {
  auto jpeg = exif_jpeg("2023:07:14 10:20:30", true);
  std::vector<uint8_t> tiff(jpeg.begin() + 12, jpeg.end() - 2);
  // string cut short
  tiff.resize(tiff.size() - 8);
  EXPECT_FALSE(tiff_exif_date(tiff));
  tiff.resize(4);
  EXPECT_FALSE(tiff_exif_date(tiff));
}

}  // namespace declutter::test
