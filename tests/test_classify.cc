/**
 * @file test_classify.cc
 * @brief sorting images into date and quarter folders
 */

#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "classify.hh"
#include "test_util.hh"

namespace declutter::test {

TEST(QuarterKeyTest, MonthToQuarter) {
  EXPECT_EQ(quarter_key("2024-01-15").value_or(""), "2024-Q1");
  EXPECT_EQ(quarter_key("2024-03-31").value_or(""), "2024-Q1");
  EXPECT_EQ(quarter_key("2024-04-01").value_or(""), "2024-Q2");
  EXPECT_EQ(quarter_key("2024-09-30").value_or(""), "2024-Q3");
  EXPECT_EQ(quarter_key("2024-12-31").value_or(""), "2024-Q4");
}

TEST(QuarterKeyTest, MalformedDate) {
  EXPECT_FALSE(quarter_key(""));
  EXPECT_FALSE(quarter_key("2024"));
  EXPECT_FALSE(quarter_key("2024-13-01"));
  EXPECT_FALSE(quarter_key("2024-xx-01"));
}

TEST(BucketKeyTest, DateIsIdentity) {
  EXPECT_EQ(bucket_key("2024-05-06", bucket_t::date).value_or(""), "2024-05-06");
  EXPECT_EQ(bucket_key("2024-05-06", bucket_t::quarter).value_or(""), "2024-Q2");
  EXPECT_EQ(parse_bucket("quarter"), bucket_t::quarter);
  EXPECT_EQ(parse_bucket("weekly"), bucket_t::date);
}

class ClassifyTest : public scratch_test_t {};

TEST_F(ClassifyTest, MtimeFallback) {
  const auto path = create_file("pic.png", std::string("no exif here"));
  set_mtime(path, local_noon(2021, 5, 3));

  const auto tally = classify(root, bucket_t::date);
  EXPECT_EQ(tally.total, 1U);
  EXPECT_EQ(tally.organized, 1U);
  EXPECT_EQ(tally.skipped, 0U);
  EXPECT_FALSE(fs::exists(path));
  EXPECT_EQ(read_file(root / "2021-05-03" / "pic.png"), "no exif here");
}

TEST_F(ClassifyTest, ExifDateWinsOverMtime) {
  const auto path = create_file(
      "sub/shot.jpg", exif_jpeg("2023:07:14 10:20:30", true));
  set_mtime(path, local_noon(2020, 1, 1));

  const auto tally = classify(root, bucket_t::date);
  EXPECT_EQ(tally.organized, 1U);
  EXPECT_TRUE(fs::exists(root / "2023-07-14" / "shot.jpg"));
  EXPECT_FALSE(fs::exists(root / "2020-01-01"));
}

TEST_F(ClassifyTest, QuarterFolders) {
  const auto a = create_file("a.jpg", exif_jpeg("2024:02:10 08:00:00", false));
  const auto b = create_file("b.png", std::string("b"));
  set_mtime(b, local_noon(2024, 11, 20));

  const auto tally = classify(root, bucket_t::quarter);
  EXPECT_EQ(tally.organized, 2U);
  EXPECT_TRUE(fs::exists(root / "2024-Q1" / "a.jpg"));
  EXPECT_TRUE(fs::exists(root / "2024-Q4" / "b.png"));
}

TEST_F(ClassifyTest, GenericFilesUntouched) {
  const auto txt = create_file("notes.txt", std::string("text"));
  const auto img = create_file("pic.gif", std::string("gif"));
  set_mtime(img, local_noon(2022, 8, 9));

  const auto tally = classify(root, bucket_t::date);
  EXPECT_EQ(tally.total, 1U);
  EXPECT_TRUE(fs::exists(txt));
  EXPECT_TRUE(fs::exists(root / "2022-08-09" / "pic.gif"));
}

TEST_F(ClassifyTest, SecondRunMovesNothing) {
  for (const auto name : {"a.png", "b.jpeg", "c.bmp"}) {
    const auto path = create_file(name, std::string(name));
    set_mtime(path, local_noon(2018, 6, 30));
  }
  const auto first = classify(root, bucket_t::date);
  EXPECT_EQ(first.organized, 3U);

  const auto second = classify(root, bucket_t::date);
  EXPECT_EQ(second.total, 3U);
  EXPECT_EQ(second.organized, 0U);
  EXPECT_EQ(second.skipped, 3U);
  EXPECT_EQ(read_file(root / "2018-06-30" / "a.png"), "a.png");
  EXPECT_EQ(read_file(root / "2018-06-30" / "b.jpeg"), "b.jpeg");
  EXPECT_EQ(read_file(root / "2018-06-30" / "c.bmp"), "c.bmp");
}

TEST_F(ClassifyTest, NameTakenIsSkipped) {
  const auto x = create_file("x/p.png", std::string("first"));
  const auto y = create_file("y/p.png", std::string("second"));
  set_mtime(x, local_noon(2017, 3, 4));
  set_mtime(y, local_noon(2017, 3, 4));

  const auto tally = classify(root, bucket_t::date);
  EXPECT_EQ(tally.total, 2U);
  EXPECT_EQ(tally.organized, 1U);
  EXPECT_EQ(tally.skipped, 1U);
  EXPECT_EQ(tally.organized + tally.skipped, tally.total);
  // the one left behind is intact
  EXPECT_TRUE(fs::exists(x) != fs::exists(y));
}

TEST_F(ClassifyTest, UppercaseSuffixIsImage) {
  const auto a = create_file("PHOTO.JPG", std::string("a"));
  const auto b = create_file("X.Png", std::string("b"));
  set_mtime(a, local_noon(2016, 2, 2));
  set_mtime(b, local_noon(2016, 2, 2));

  const auto tally = classify(root, bucket_t::date);
  EXPECT_EQ(tally.total, 2U);
  EXPECT_EQ(tally.organized, 2U);
  EXPECT_TRUE(fs::exists(root / "2016-02-02" / "PHOTO.JPG"));
  EXPECT_TRUE(fs::exists(root / "2016-02-02" / "X.Png"));
}

TEST_F(ClassifyTest, QuarantineFoldersLeftAlone) {
  const auto kept = create_file("duplicates_20240101_000000/copy.png",
                                std::string("copy"));
  const auto other = create_file("elsewhere/q/moved.png", std::string("m"));
  const auto nested = create_file("trip/duplicates_x/nested.png",
                                  std::string("n"));
  for (const auto& path : {kept, other, nested}) {
    set_mtime(path, local_noon(2015, 7, 7));
  }

  const auto tally = classify(root, bucket_t::date, {root / "elsewhere" / "q"});
  EXPECT_EQ(tally.total, 1U);
  EXPECT_EQ(tally.organized, 1U);
  EXPECT_TRUE(fs::exists(kept));
  EXPECT_TRUE(fs::exists(other));
  // only a top level duplicates_* folder is a quarantine
  EXPECT_TRUE(fs::exists(root / "2015-07-07" / "nested.png"));
}

TEST_F(ClassifyTest, InvalidDirectoryThrows) {
  EXPECT_THROW(classify(root / "missing", bucket_t::date),
               std::invalid_argument);
}

}  // namespace declutter::test
