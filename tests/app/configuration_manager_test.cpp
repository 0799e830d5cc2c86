/**
 * @file configuration_manager_test.cpp
 * @brief Unit tests for ConfigurationManager
 */

#include "app/configuration_manager.h"

#include <gtest/gtest.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "utils/structured_log.h"

using namespace phonegen::app;
using phonegen::utils::ErrorCode;
using phonegen::utils::StructuredLog;

namespace {

/**
 * @brief Test fixture that properly manages spdlog state
 *
 * Each test starts with a fresh stdout logger at info level and text
 * structured log format, and gets its own temporary directory.
 */
class ConfigurationManagerTestFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    spdlog::drop_all();
    auto console_sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("phonegen_test", console_sink));
    spdlog::set_level(spdlog::level::info);
    StructuredLog::SetFormat(StructuredLog::Format::kText);

    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    test_dir_ = std::filesystem::temp_directory_path() /
                ("phonegen_config_mgr_" + std::to_string(getpid()) + "_" + info->name());
    std::filesystem::remove_all(test_dir_);
    std::filesystem::create_directories(test_dir_);
  }

  void TearDown() override {
    spdlog::drop_all();
    auto console_sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("default", console_sink));
    spdlog::set_level(spdlog::level::info);
    StructuredLog::SetFormat(StructuredLog::Format::kJson);

    std::error_code error_code;
    std::filesystem::remove_all(test_dir_, error_code);
  }

  /**
   * @brief Write a YAML config with custom logging settings
   */
  std::string CreateConfig(const std::string& log_level, const std::string& log_format, const std::string& log_file) {
    std::string path = (test_dir_ / "config.yaml").string();
    std::ofstream ofs(path);
    ofs << "source:\n"
        << "  type: csv\n"
        << "  csv_path: \"" << (test_dir_ / "phone_location.csv").string() << "\"\n"
        << "\n"
        << "logging:\n"
        << "  level: \"" << log_level << "\"\n"
        << "  format: \"" << log_format << "\"\n";
    if (!log_file.empty()) {
      ofs << "  file: \"" << log_file << "\"\n";
    }
    return path;
  }

  std::filesystem::path test_dir_;
};

std::string ReadFile(const std::string& path) {
  std::ifstream ifs(path);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

}  // namespace

TEST_F(ConfigurationManagerTestFixture, CreateLoadsConfig) {
  auto path = CreateConfig("info", "json", "");

  auto config_mgr = ConfigurationManager::Create(path, "");
  ASSERT_TRUE(config_mgr) << config_mgr.error().to_string();
  EXPECT_EQ((*config_mgr)->GetConfigFilePath(), path);
  EXPECT_EQ((*config_mgr)->GetConfig().source.type, "csv");
  EXPECT_EQ((*config_mgr)->GetConfig().source.csv_path, (test_dir_ / "phone_location.csv").string());
}

TEST_F(ConfigurationManagerTestFixture, CreateFailsForMissingFile) {
  auto config_mgr = ConfigurationManager::Create((test_dir_ / "missing.yaml").string(), "");
  ASSERT_FALSE(config_mgr);
  EXPECT_EQ(config_mgr.error().code(), ErrorCode::kConfigFileNotFound);
}

/**
 * @brief Test that ApplyLoggingConfig sets every configured level
 */
TEST_F(ConfigurationManagerTestFixture, ApplyLoggingConfigAllLevels) {
  const std::vector<std::pair<std::string, spdlog::level::level_enum>> levels = {{"debug", spdlog::level::debug},
                                                                                 {"info", spdlog::level::info},
                                                                                 {"warn", spdlog::level::warn},
                                                                                 {"error", spdlog::level::err}};

  for (const auto& [level_str, level_enum] : levels) {
    auto config_mgr = ConfigurationManager::Create(CreateConfig(level_str, "json", ""), "");
    ASSERT_TRUE(config_mgr) << "Failed to create ConfigurationManager for level: " << level_str;

    auto result = (*config_mgr)->ApplyLoggingConfig();
    ASSERT_TRUE(result) << "ApplyLoggingConfig failed for level: " << level_str;

    EXPECT_EQ(spdlog::get_level(), level_enum) << "Log level mismatch for: " << level_str;
  }
}

TEST_F(ConfigurationManagerTestFixture, ApplyLoggingConfigSetsFormat) {
  auto config_mgr = ConfigurationManager::Create(CreateConfig("info", "json", ""), "");
  ASSERT_TRUE(config_mgr);
  ASSERT_TRUE((*config_mgr)->ApplyLoggingConfig());
  EXPECT_EQ(StructuredLog::GetFormat(), StructuredLog::Format::kJson);
}

/**
 * @brief File logging honours the level and creates missing directories
 */
TEST_F(ConfigurationManagerTestFixture, ApplyLoggingConfigFile) {
  std::string log_file = (test_dir_ / "logs" / "phonegen.log").string();

  auto config_mgr = ConfigurationManager::Create(CreateConfig("warn", "text", log_file), "");
  ASSERT_TRUE(config_mgr);

  auto result = (*config_mgr)->ApplyLoggingConfig();
  ASSERT_TRUE(result) << "ApplyLoggingConfig failed: " << result.error().to_string();
  EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
  EXPECT_TRUE(std::filesystem::is_directory(test_dir_ / "logs"));

  spdlog::info("This should NOT be logged");
  spdlog::warn("This SHOULD be logged");
  spdlog::default_logger()->flush();

  std::string log_contents = ReadFile(log_file);
  EXPECT_EQ(log_contents.find("This should NOT be logged"), std::string::npos);
  EXPECT_NE(log_contents.find("This SHOULD be logged"), std::string::npos);
}

TEST_F(ConfigurationManagerTestFixture, PrintConfigTest) {
  auto config_mgr = ConfigurationManager::Create(CreateConfig("info", "json", ""), "");
  ASSERT_TRUE(config_mgr);

  ::testing::internal::CaptureStdout();
  int exit_code = (*config_mgr)->PrintConfigTest();
  std::string output = ::testing::internal::GetCapturedStdout();

  EXPECT_EQ(exit_code, 0);
  EXPECT_NE(output.find("Configuration file syntax is OK"), std::string::npos);
  EXPECT_NE(output.find("CSV: "), std::string::npos);
  EXPECT_NE(output.find("workers auto"), std::string::npos);
}
