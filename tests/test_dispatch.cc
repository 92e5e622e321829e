/**
 * @file test_dispatch.cc
 * @brief fingerprinting on the worker pool
 */

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "digest.hh"
#include "dispatch.hh"
#include "ls_dir_rec.hh"
#include "test_util.hh"

namespace declutter::test {

namespace {

// fingerprint -> sorted paths, independent of merge order
std::map<std::string, std::vector<std::string>> flatten(const fp_map_t& fp_map) {
  std::map<std::string, std::vector<std::string>> flat;
  for (const auto& [fingerprint, files] : fp_map) {
    auto& paths = flat[fingerprint];
    for (const auto& file : files) {
      paths.push_back(file.path().string());
    }
    std::sort(paths.begin(), paths.end());
  }
  return flat;
}

}  // namespace

class DispatchTest : public scratch_test_t {
 protected:
  void SetUp() override {
    scratch_test_t::SetUp();
    for (auto i = 0; i < 40; ++i) {
      create_file("f" + std::to_string(i) + ".txt",
                  "content " + std::to_string(i % 7));
    }
    create_image("a.png", gradient());
    create_image("b.png", gradient());
    create_file("empty.txt", std::string());
  }
};

TEST_F(DispatchTest, ResultIndependentOfThreadCount) {
  const auto entries = ls_dir_rec(root);
  const auto* md = digest_by_name("md5");
  const auto one = dispatch(entries, md, 1);
  for (const uint32_t threads : {4U, 8U}) {
    const auto many = dispatch(entries, md, threads);
    EXPECT_EQ(flatten(one.generic), flatten(many.generic)) << threads;
    EXPECT_EQ(flatten(one.image), flatten(many.image)) << threads;
  }
  EXPECT_EQ(one.generic.size(), 7U);
  EXPECT_EQ(one.image.size(), 1U);
}

TEST_F(DispatchTest, ProgressReachesTotal) {
  const auto entries = ls_dir_rec(root);
  std::vector<std::size_t> seen;
  std::size_t last_total = 0;
  dispatch(entries, digest_by_name("md5"), 4,
           [&](const std::size_t done, const std::size_t total) {
             seen.push_back(done);
             last_total = total;
           });
  ASSERT_EQ(seen.size(), entries.size());
  EXPECT_EQ(last_total, entries.size());
  for (std::size_t i = 0; i < seen.size(); ++i) {
    EXPECT_EQ(seen[i], i + 1);
  }
}

TEST_F(DispatchTest, OversizedPoolStillComplete) {
  const auto entries = ls_dir_rec(root);
  const auto* md = digest_by_name("md5");
  EXPECT_EQ(flatten(dispatch(entries, md, 1).generic),
            flatten(dispatch(entries, md, 200).generic));
}

TEST_F(DispatchTest, EmptyInput) {
  const std::vector<dir_entry_t> none;
  const auto table = dispatch(none, digest_by_name("md5"), 4);
  EXPECT_TRUE(table.image.empty());
  EXPECT_TRUE(table.generic.empty());
}

TEST(DefaultThreadsTest, Bounded) {
  const auto n = default_threads();
  EXPECT_GE(n, 1U);
  EXPECT_LE(n, 8U);
}

TEST(DefaultThreadsTest, ClampedToWorkerCap) {
  EXPECT_EQ(clamp_threads(0), default_threads());
  EXPECT_EQ(clamp_threads(1), 1U);
  EXPECT_EQ(clamp_threads(3), 3U);
  EXPECT_EQ(clamp_threads(8), 8U);
  EXPECT_EQ(clamp_threads(64), 8U);
  EXPECT_EQ(clamp_threads(256), 8U);
}

}  // namespace declutter::test
