/**
 * @file generation_service_test.cpp
 * @brief End-to-end tests for GenerationService
 */

#include "service/generation_service.h"

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "test_records.h"

using namespace phonegen::service;
using phonegen::index::LookupIndex;
using phonegen::plan::FilterRequest;
using phonegen::testing::MakeRecord;
using phonegen::testing::SampleRecords;
using phonegen::utils::ErrorCode;

namespace fs = std::filesystem;

namespace {

FilterRequest MakeRequest(const std::string& prefix, const std::string& province, const std::string& city) {
  FilterRequest request;
  request.prefix = prefix;
  request.province = province;
  request.city = city;
  return request;
}

std::string ReadFile(const fs::path& path) {
  std::ifstream stream(path, std::ios::binary);
  std::ostringstream content;
  content << stream.rdbuf();
  return content.str();
}

}  // namespace

class GenerationServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    test_dir_ = fs::temp_directory_path() /
                ("phonegen_generation_service_" + std::to_string(getpid()) + "_" + info->name());
    fs::remove_all(test_dir_);

    auto built = LookupIndex::Build(SampleRecords());
    ASSERT_TRUE(built) << built.error().to_string();
    index_ = std::move(*built);

    options_.max_count = 1000000;
    options_.workers = 4;
    options_.file_size_limit_bytes = 1024 * 1024;
    options_.output_dir = test_dir_.string();
  }

  void TearDown() override {
    std::error_code error_code;
    fs::remove_all(test_dir_, error_code);
  }

  fs::path test_dir_;
  std::unique_ptr<LookupIndex> index_;
  GenerationOptions options_;
};

/**
 * @brief One segment with all trailing digits fixed yields one number
 */
TEST_F(GenerationServiceTest, SingleFixedNumber) {
  auto single = LookupIndex::Build({MakeRecord("130", "0008", "湖北", "武汉", 3)});
  ASSERT_TRUE(single);
  GenerationService service(**single, options_);

  auto request = MakeRequest("130", "湖北", "武汉");
  request.trailing_fixed4 = "1234";

  auto result = service.Generate(request);
  ASSERT_TRUE(result) << result.error().error.to_string();
  EXPECT_EQ(result->count, 1U);
  ASSERT_EQ(result->manifest.entries.size(), 1U);
  EXPECT_EQ(result->manifest.entries[0].filename, result->base_name + ".txt");
  EXPECT_EQ(result->base_name.rfind("130_湖北_武汉_1234_", 0), 0U);
  EXPECT_EQ(ReadFile(test_dir_ / result->manifest.entries[0].filename), "13000081234\n");

  auto json = result->ToJson();
  EXPECT_EQ(json["code"], kResponseOk);
  EXPECT_EQ(json["data"]["count"], 1);
  ASSERT_EQ(json["data"]["files"].size(), 1U);
  EXPECT_EQ(json["data"]["files"][0]["name"], result->manifest.entries[0].filename);
}

/**
 * @brief A full free block split across files by the size limit
 */
TEST_F(GenerationServiceTest, FreeBlockAcrossFiles) {
  options_.file_size_limit_bytes = 12000;
  GenerationService service(*index_, options_);

  auto request = MakeRequest("138", "广东", "深圳");
  request.operator_codes = {1};

  auto result = service.Generate(request);
  ASSERT_TRUE(result) << result.error().error.to_string();
  EXPECT_EQ(result->count, 10000U);
  ASSERT_EQ(result->manifest.entries.size(), 10U);

  std::string concatenated;
  for (size_t i = 0; i < result->manifest.entries.size(); ++i) {
    const auto& entry = result->manifest.entries[i];
    EXPECT_EQ(entry.filename, result->base_name + "_part" + std::to_string(i + 1) + ".txt");
    EXPECT_EQ(entry.line_count, 1000U);
    concatenated += ReadFile(test_dir_ / entry.filename);
  }
  EXPECT_EQ(result->manifest.total_lines_written, 10000U);
  ASSERT_EQ(concatenated.size(), 10000U * 12);
  EXPECT_EQ(concatenated.substr(0, 12), "13800000000\n");
  EXPECT_EQ(concatenated.substr(concatenated.size() - 12), "13800009999\n");
}

/**
 * @brief Repeating a request, with any worker count, reproduces the same files
 */
TEST_F(GenerationServiceTest, RepeatedRequestIsIdempotent) {
  options_.file_size_limit_bytes = 50000;
  auto request = MakeRequest("130", "湖北", "武汉");

  auto collect = [this](const GenerationResult& result) {
    std::vector<std::string> contents;
    for (const auto& entry : result.manifest.entries) {
      contents.push_back(ReadFile(test_dir_ / entry.filename));
    }
    return contents;
  };

  GenerationService service(*index_, options_);
  auto first = service.Generate(request);
  ASSERT_TRUE(first) << first.error().error.to_string();
  auto second = service.Generate(request);
  ASSERT_TRUE(second) << second.error().error.to_string();

  options_.workers = 7;
  GenerationService wider(*index_, options_);
  auto third = wider.Generate(request);
  ASSERT_TRUE(third) << third.error().error.to_string();

  EXPECT_EQ(first->count, 30000U);
  EXPECT_EQ(second->count, first->count);
  EXPECT_EQ(third->count, first->count);
  EXPECT_NE(second->base_name, first->base_name);
  EXPECT_NE(third->base_name, first->base_name);
  EXPECT_NE(third->base_name, second->base_name);

  const auto first_contents = collect(*first);
  EXPECT_GT(first_contents.size(), 1U);
  EXPECT_EQ(collect(*second), first_contents);
  EXPECT_EQ(collect(*third), first_contents);
  EXPECT_EQ(first_contents.front().substr(0, 12), "13000010000\n");
}

TEST_F(GenerationServiceTest, NoCoverageProducesNoFiles) {
  GenerationService service(*index_, options_);

  auto result = service.Generate(MakeRequest("130", "湖北", "襄阳"));
  ASSERT_TRUE(result);
  EXPECT_EQ(result->count, 0U);
  EXPECT_TRUE(result->manifest.empty());
  EXPECT_FALSE(fs::exists(test_dir_));

  auto json = result->ToJson();
  EXPECT_EQ(json["code"], kResponseOk);
  EXPECT_EQ(json["data"]["count"], 0);
  EXPECT_TRUE(json["data"]["files"].empty());
}

TEST_F(GenerationServiceTest, LimitExceededReportsCount) {
  options_.max_count = 9999;
  GenerationService service(*index_, options_);

  auto request = MakeRequest("138", "广东", "深圳");
  request.operator_codes = {1};

  auto result = service.Generate(request);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().error.code(), ErrorCode::kPlanLimitExceeded);
  ASSERT_TRUE(result.error().computed_count.has_value());
  EXPECT_EQ(*result.error().computed_count, 10000U);
  EXPECT_EQ(result.error().ResponseCode(), kResponseBadRequest);

  auto json = result.error().ToJson();
  EXPECT_EQ(json["code"], kResponseBadRequest);
  EXPECT_EQ(json["data"]["count"], 10000);
  EXPECT_EQ(json["data"]["error_code"], static_cast<int32_t>(ErrorCode::kPlanLimitExceeded));
  EXPECT_FALSE(fs::exists(test_dir_));
}

TEST_F(GenerationServiceTest, ValidationErrorIsBadRequest) {
  GenerationService service(*index_, options_);

  auto result = service.Generate(MakeRequest("13x", "湖北", "武汉"));
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().error.code(), ErrorCode::kPlanValidationError);
  EXPECT_FALSE(result.error().computed_count.has_value());

  auto json = result.error().ToJson();
  EXPECT_EQ(json["code"], kResponseBadRequest);
  EXPECT_FALSE(json["data"].contains("count"));
}

TEST(GenerationErrorTest, InternalErrorsAre500) {
  GenerationError error;
  error.error = phonegen::utils::MakeError(ErrorCode::kPartitionFailed, "worker failed");
  error.failed_partition = 3;

  EXPECT_EQ(error.ResponseCode(), kResponseInternalError);
  auto json = error.ToJson();
  EXPECT_EQ(json["code"], kResponseInternalError);
  EXPECT_EQ(json["message"], "worker failed");
  EXPECT_EQ(json["data"]["partition"], 3);
}

/**
 * @brief Identical concurrent requests never share output files
 */
TEST_F(GenerationServiceTest, ConcurrentRequestsGetDistinctNames) {
  options_.file_size_limit_bytes = 50000;
  GenerationService service(*index_, options_);

  constexpr int kRequests = 6;
  std::vector<std::string> names(kRequests);
  std::vector<char> succeeded(kRequests, 0);
  std::vector<std::thread> threads;
  for (int i = 0; i < kRequests; ++i) {
    threads.emplace_back([&service, &names, &succeeded, i]() {
      auto request = MakeRequest("130", "湖北", "武汉");
      auto result = service.Generate(request);
      if (result) {
        names[i] = result->base_name;
        succeeded[i] = 1;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<std::string> unique_names;
  for (int i = 0; i < kRequests; ++i) {
    ASSERT_NE(succeeded[i], 0) << "request " << i;
    unique_names.insert(names[i]);
  }
  EXPECT_EQ(unique_names.size(), static_cast<size_t>(kRequests));

  // 30000 lines at 12 bytes in 50000-byte files
  size_t file_count = 0;
  for (const auto& entry : fs::directory_iterator(test_dir_)) {
    (void)entry;
    ++file_count;
  }
  EXPECT_EQ(file_count, static_cast<size_t>(kRequests) * 8);
}

TEST_F(GenerationServiceTest, ProvincesAndCities) {
  GenerationService service(*index_, options_);
  EXPECT_EQ(service.Provinces(), index_->Provinces());
  EXPECT_EQ(service.Cities("湖北").size(), 2U);

  auto json = ListResponse(service.Cities("广东"));
  EXPECT_EQ(json["code"], kResponseOk);
  EXPECT_EQ(json["data"].size(), 2U);
}

TEST(GenerationOptionsTest, FromConfig) {
  phonegen::config::Config config;
  config.generator.max_count = 77;
  config.generator.workers = 3;
  config.generator.file_size_limit_bytes = 4096;
  config.generator.name_template = "{prefix}";
  config.output.dir = "out";

  auto options = GenerationOptions::FromConfig(config);
  EXPECT_EQ(options.max_count, 77U);
  EXPECT_EQ(options.workers, 3U);
  EXPECT_EQ(options.file_size_limit_bytes, 4096U);
  EXPECT_EQ(options.name_template, "{prefix}");
  EXPECT_EQ(options.output_dir, "out");
}
