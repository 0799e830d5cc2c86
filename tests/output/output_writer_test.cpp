/**
 * @file output_writer_test.cpp
 * @brief Unit tests for OutputWriter
 */

#include "output/output_writer.h"

#include <gtest/gtest.h>
#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "generator/enumerator.h"
#include "generator/partition_dispatcher.h"
#include "test_records.h"

using namespace phonegen::output;
using phonegen::generator::Enumerator;
using phonegen::generator::PartitionDispatcher;
using phonegen::generator::PartitionResult;
using phonegen::plan::EnumerationPlan;
using phonegen::plan::FixedHighDigitTrailing;
using phonegen::plan::FreeTrailing;
using phonegen::plan::TrailingRule;
using phonegen::plan::VariantsPerRecord;
using phonegen::testing::MakeRecord;
using phonegen::utils::ErrorCode;

namespace fs = std::filesystem;

namespace {

constexpr uint64_t kLineBytes = 12;

EnumerationPlan MakePlan(size_t segment_count, const TrailingRule& rule) {
  EnumerationPlan plan;
  plan.prefix = "130";
  for (size_t i = 0; i < segment_count; ++i) {
    plan.candidates.push_back(MakeRecord("130", std::to_string(2000 + i), "湖北", "武汉", 2));
  }
  plan.trailing_rule = rule;
  plan.total_count = plan.candidates.size() * VariantsPerRecord(rule);
  return plan;
}

std::vector<PartitionResult> Generate(const EnumerationPlan& plan, size_t workers) {
  PartitionDispatcher dispatcher(2);
  auto results = dispatcher.Run(plan, workers);
  EXPECT_TRUE(results);
  return results ? *results : std::vector<PartitionResult>{};
}

std::string ReadFile(const fs::path& path) {
  std::ifstream stream(path, std::ios::binary);
  std::ostringstream content;
  content << stream.rdbuf();
  return content.str();
}

}  // namespace

class OutputWriterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    test_dir_ = fs::temp_directory_path() /
                ("phonegen_output_writer_" + std::to_string(getpid()) + "_" + info->name());
    fs::remove_all(test_dir_);
  }

  void TearDown() override {
    std::error_code error_code;
    fs::remove_all(test_dir_, error_code);
  }

  [[nodiscard]] std::vector<std::string> ListFiles() const {
    std::vector<std::string> names;
    if (!fs::exists(test_dir_)) {
      return names;
    }
    for (const auto& entry : fs::directory_iterator(test_dir_)) {
      names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
  }

  fs::path test_dir_;
};

TEST_F(OutputWriterTest, SingleFileUsesPlainName) {
  auto plan = MakePlan(1, FixedHighDigitTrailing{"888"});
  auto results = Generate(plan, 3);

  OutputWriter writer(test_dir_.string());
  auto manifest = writer.Write(plan, results, 1024, "batch");
  ASSERT_TRUE(manifest) << manifest.error().to_string();

  ASSERT_EQ(manifest->entries.size(), 1U);
  EXPECT_EQ(manifest->entries[0].filename, "batch.txt");
  EXPECT_EQ(manifest->entries[0].ordinal, 1U);
  EXPECT_EQ(manifest->entries[0].line_count, 10U);
  EXPECT_EQ(manifest->entries[0].byte_size, 10 * kLineBytes);
  EXPECT_EQ(manifest->total_lines_written, 10U);
  EXPECT_EQ(manifest->directory, test_dir_.string());

  EXPECT_EQ(ListFiles(), (std::vector<std::string>{"batch.txt"}));
  EXPECT_EQ(ReadFile(test_dir_ / "batch.txt"),
            "13020000888\n13020001888\n13020002888\n13020003888\n13020004888\n"
            "13020005888\n13020006888\n13020007888\n13020008888\n13020009888\n");
}

/**
 * @brief Files roll over at the threshold and never split a line
 */
TEST_F(OutputWriterTest, RolloverAtThreshold) {
  auto plan = MakePlan(1, FixedHighDigitTrailing{"888"});
  auto results = Generate(plan, 4);

  OutputWriter writer(test_dir_.string());
  // 40 bytes hold three 12-byte lines
  auto manifest = writer.Write(plan, results, 40, "batch");
  ASSERT_TRUE(manifest) << manifest.error().to_string();

  ASSERT_EQ(manifest->entries.size(), 4U);
  const std::vector<uint64_t> expected_lines = {3, 3, 3, 1};
  for (size_t i = 0; i < manifest->entries.size(); ++i) {
    const auto& entry = manifest->entries[i];
    EXPECT_EQ(entry.ordinal, i + 1);
    EXPECT_EQ(entry.filename, "batch_part" + std::to_string(i + 1) + ".txt");
    EXPECT_EQ(entry.line_count, expected_lines[i]);
    EXPECT_LE(entry.byte_size, 40U);
    EXPECT_EQ(fs::file_size(test_dir_ / entry.filename), entry.byte_size);
  }
  EXPECT_EQ(ListFiles(), (std::vector<std::string>{"batch_part1.txt", "batch_part2.txt", "batch_part3.txt",
                                                   "batch_part4.txt"}));
}

TEST_F(OutputWriterTest, ThresholdOnLineBoundary) {
  auto plan = MakePlan(1, FixedHighDigitTrailing{"888"});
  auto results = Generate(plan, 1);

  OutputWriter writer(test_dir_.string());
  auto manifest = writer.Write(plan, results, 5 * kLineBytes, "batch");
  ASSERT_TRUE(manifest);
  ASSERT_EQ(manifest->entries.size(), 2U);
  EXPECT_EQ(manifest->entries[0].byte_size, 5 * kLineBytes);
  EXPECT_EQ(manifest->entries[1].byte_size, 5 * kLineBytes);
}

TEST_F(OutputWriterTest, ThresholdBelowOneLine) {
  auto plan = MakePlan(1, FixedHighDigitTrailing{"888"});
  auto results = Generate(plan, 2);

  OutputWriter writer(test_dir_.string());
  auto manifest = writer.Write(plan, results, 5, "tiny");
  ASSERT_TRUE(manifest);
  ASSERT_EQ(manifest->entries.size(), 10U);
  for (const auto& entry : manifest->entries) {
    EXPECT_EQ(entry.line_count, 1U);
  }
}

/**
 * @brief Files concatenated in ordinal order equal the sequential enumeration
 */
TEST_F(OutputWriterTest, ConcatenationMatchesEnumeration) {
  auto plan = MakePlan(3, FreeTrailing{});
  auto results = Generate(plan, 7);

  OutputWriter writer(test_dir_.string());
  auto manifest = writer.Write(plan, results, 100000, "full");
  ASSERT_TRUE(manifest);

  std::string concatenated;
  uint64_t line_sum = 0;
  for (const auto& entry : manifest->entries) {
    concatenated += ReadFile(test_dir_ / entry.filename);
    line_sum += entry.line_count;
    EXPECT_LE(entry.byte_size, 100000U);
  }

  std::string expected;
  ASSERT_TRUE(Enumerator::AppendRange(plan, 0, plan.total_count, expected));
  EXPECT_EQ(concatenated, expected);
  EXPECT_EQ(line_sum, plan.total_count);
  EXPECT_EQ(manifest->total_lines_written, plan.total_count);
  EXPECT_EQ(manifest->TotalBytes(), plan.total_count * kLineBytes);
}

TEST_F(OutputWriterTest, EmptyPlanWritesNothing) {
  auto plan = MakePlan(0, FreeTrailing{});
  auto results = Generate(plan, 3);

  OutputWriter writer(test_dir_.string());
  auto manifest = writer.Write(plan, results, 1024, "empty");
  ASSERT_TRUE(manifest);
  EXPECT_TRUE(manifest->empty());
  EXPECT_EQ(manifest->total_lines_written, 0U);
  EXPECT_FALSE(fs::exists(test_dir_));
}

TEST_F(OutputWriterTest, InvalidArguments) {
  auto plan = MakePlan(1, FixedHighDigitTrailing{"888"});
  auto results = Generate(plan, 1);
  OutputWriter writer(test_dir_.string());

  auto zero_threshold = writer.Write(plan, results, 0, "batch");
  ASSERT_FALSE(zero_threshold);
  EXPECT_EQ(zero_threshold.error().code(), ErrorCode::kInvalidArgument);

  auto empty_name = writer.Write(plan, results, 1024, "");
  ASSERT_FALSE(empty_name);
  EXPECT_EQ(empty_name.error().code(), ErrorCode::kInvalidArgument);
}

TEST_F(OutputWriterTest, NonContiguousResultsRejected) {
  auto plan = MakePlan(1, FixedHighDigitTrailing{"888"});
  auto results = Generate(plan, 2);
  ASSERT_EQ(results.size(), 2U);
  OutputWriter writer(test_dir_.string());

  auto gap = results;
  gap[1].start_offset += 1;
  auto gap_result = writer.Write(plan, gap, 1024, "batch");
  ASSERT_FALSE(gap_result);
  EXPECT_EQ(gap_result.error().code(), ErrorCode::kInvalidArgument);

  auto partial = results;
  partial.pop_back();
  auto partial_result = writer.Write(plan, partial, 1024, "batch");
  ASSERT_FALSE(partial_result);
  EXPECT_EQ(partial_result.error().code(), ErrorCode::kInvalidArgument);

  auto short_lines = results;
  short_lines[0].lines.pop_back();
  EXPECT_FALSE(writer.Write(plan, short_lines, 1024, "batch"));

  EXPECT_TRUE(ListFiles().empty());
}

/**
 * @brief A failure part-way through removes every file already written
 */
TEST_F(OutputWriterTest, FailureRemovesPartialFiles) {
  auto plan = MakePlan(1, FixedHighDigitTrailing{"888"});
  auto results = Generate(plan, 1);

  // A directory where the second part file should go makes its creation fail
  fs::create_directories(test_dir_ / "batch_part2.txt.tmp");

  OutputWriter writer(test_dir_.string());
  auto manifest = writer.Write(plan, results, 3 * kLineBytes, "batch");
  ASSERT_FALSE(manifest);
  EXPECT_EQ(manifest.error().code(), ErrorCode::kOutputWriteFailed);

  EXPECT_EQ(ListFiles(), (std::vector<std::string>{"batch_part2.txt.tmp"}));
}

TEST_F(OutputWriterTest, UncreatableDirectory) {
  fs::create_directories(test_dir_);
  {
    std::ofstream blocker(test_dir_ / "not_a_dir");
    blocker << "x";
  }

  auto plan = MakePlan(1, FixedHighDigitTrailing{"888"});
  auto results = Generate(plan, 1);

  OutputWriter writer((test_dir_ / "not_a_dir" / "out").string());
  auto manifest = writer.Write(plan, results, 1024, "batch");
  ASSERT_FALSE(manifest);
  EXPECT_EQ(manifest.error().code(), ErrorCode::kOutputDirectoryError);
}
