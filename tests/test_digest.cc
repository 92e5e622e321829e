/**
 * @file test_digest.cc
 * @brief content digests of generic files through OpenSSL EVP
 */

#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "digest.hh"
#include "test_util.hh"

namespace declutter::test {

class DigestTest : public scratch_test_t {};

TEST_F(DigestTest, Md5OfKnownContent) {
  const auto path = create_file("abc.txt", std::string("abc"));
  auto hex = file_digest(path, digest_by_name("md5"));
  ASSERT_TRUE(hex.has_value());
  EXPECT_EQ(*hex, "900150983cd24fb0d6963f7d28e17f72");
}

TEST_F(DigestTest, Sha256Selectable) {
  const auto path = create_file("abc.txt", std::string("abc"));
  auto hex = file_digest(path, digest_by_name("sha256"));
  ASSERT_TRUE(hex.has_value());
  EXPECT_EQ(*hex,
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// spans several read blocks
TEST_F(DigestTest, LargeFileIsDeterministic) {
  std::string content;
  for (auto i = 0; i < 100000; ++i) {
    content += static_cast<char>('a' + i % 26);
  }
  const auto a = create_file("a.bin", content);
  const auto b = create_file("sub/b.bin", content);
  content.back() = '#';
  const auto c = create_file("c.bin", content);

  const auto* md = digest_by_name("md5");
  auto ha = file_digest(a, md);
  auto hb = file_digest(b, md);
  auto hc = file_digest(c, md);
  ASSERT_TRUE(ha && hb && hc);
  EXPECT_EQ(*ha, *hb);
  EXPECT_NE(*ha, *hc);
  EXPECT_EQ(ha->size(), 32U);
}

TEST_F(DigestTest, MissingFileHasNoDigest) {
  EXPECT_FALSE(file_digest(root / "missing", digest_by_name("md5")));
}

TEST(DigestNameTest, UnknownAlgorithmThrows) {
  EXPECT_THROW(digest_by_name("no-such-digest"), std::invalid_argument);
}

TEST(DigestNameTest, HexIsLowercase) {
  const unsigned char bytes[] = {0x00, 0xab, 0x7f, 0xff};
  EXPECT_EQ(to_hex(bytes, sizeof(bytes)), "00ab7fff");
}

}  // namespace declutter::test
