/**
 * @file artifact_cleaner_test.cpp
 * @brief Unit tests for ArtifactCleaner
 */

#include "output/artifact_cleaner.h"

#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace phonegen::output;

namespace fs = std::filesystem;

class ArtifactCleanerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    test_dir_ = fs::temp_directory_path() /
                ("phonegen_artifact_cleaner_" + std::to_string(getpid()) + "_" + info->name());
    fs::remove_all(test_dir_);
    fs::create_directories(test_dir_);
  }

  void TearDown() override {
    std::error_code error_code;
    fs::remove_all(test_dir_, error_code);
  }

  fs::path CreateFile(const std::string& name, std::chrono::hours age) {
    fs::path path = test_dir_ / name;
    {
      std::ofstream stream(path);
      stream << "13000000000\n";
    }
    fs::last_write_time(path, fs::file_time_type::clock::now() - age);
    return path;
  }

  fs::path test_dir_;
};

TEST_F(ArtifactCleanerTest, RemovesOnlyExpiredFiles) {
  auto old_file = CreateFile("old.txt", std::chrono::hours(30));
  auto older_file = CreateFile("older_part1.txt", std::chrono::hours(100));
  auto fresh_file = CreateFile("fresh.txt", std::chrono::hours(1));

  ArtifactCleaner cleaner(test_dir_.string(), 24);
  auto removed = cleaner.CleanupExpired();
  ASSERT_TRUE(removed) << removed.error().to_string();
  EXPECT_EQ(*removed, 2U);

  EXPECT_FALSE(fs::exists(old_file));
  EXPECT_FALSE(fs::exists(older_file));
  EXPECT_TRUE(fs::exists(fresh_file));
}

TEST_F(ArtifactCleanerTest, DirectoriesAreKept) {
  fs::create_directories(test_dir_ / "nested");
  fs::last_write_time(test_dir_ / "nested", fs::file_time_type::clock::now() - std::chrono::hours(48));

  ArtifactCleaner cleaner(test_dir_.string(), 24);
  auto removed = cleaner.CleanupExpired();
  ASSERT_TRUE(removed);
  EXPECT_EQ(*removed, 0U);
  EXPECT_TRUE(fs::exists(test_dir_ / "nested"));
}

TEST_F(ArtifactCleanerTest, ZeroHoursRemovesEverythingOlderThanNow) {
  CreateFile("a.txt", std::chrono::hours(1));
  CreateFile("b.txt", std::chrono::hours(2));

  ArtifactCleaner cleaner(test_dir_.string(), 0);
  auto removed = cleaner.CleanupExpired();
  ASSERT_TRUE(removed);
  EXPECT_EQ(*removed, 2U);
}

TEST_F(ArtifactCleanerTest, MissingDirectory) {
  ArtifactCleaner cleaner((test_dir_ / "does_not_exist").string(), 24);
  auto removed = cleaner.CleanupExpired();
  ASSERT_TRUE(removed);
  EXPECT_EQ(*removed, 0U);
}

/**
 * @brief Listing failures come back as errors instead of filesystem exceptions
 */
TEST_F(ArtifactCleanerTest, NotADirectoryIsAnError) {
  auto plain_file = CreateFile("downloads", std::chrono::hours(48));

  ArtifactCleaner cleaner(plain_file.string(), 24);
  phonegen::utils::Expected<size_t, phonegen::utils::Error> removed = static_cast<size_t>(0);
  EXPECT_NO_THROW(removed = cleaner.CleanupExpired());
  ASSERT_FALSE(removed);
  EXPECT_EQ(removed.error().code(), phonegen::utils::ErrorCode::kOutputDirectoryError);
  EXPECT_TRUE(fs::exists(plain_file));
}

/**
 * @brief Removing entries while sweeping a large directory visits every file once
 */
TEST_F(ArtifactCleanerTest, SweepsManyFiles) {
  for (int i = 0; i < 200; ++i) {
    CreateFile("batch_part" + std::to_string(i + 1) + ".txt", std::chrono::hours(48));
  }

  ArtifactCleaner cleaner(test_dir_.string(), 24);
  auto removed = cleaner.CleanupExpired();
  ASSERT_TRUE(removed) << removed.error().to_string();
  EXPECT_EQ(*removed, 200U);
  EXPECT_TRUE(fs::is_empty(test_dir_));
}
