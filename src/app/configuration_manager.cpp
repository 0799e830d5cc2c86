/**
 * @file configuration_manager.cpp
 * @brief Configuration manager implementation
 */

#include "app/configuration_manager.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace phonegen::app {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {
constexpr const char* kLoggerName = "phonegen";
}  // namespace

Expected<std::unique_ptr<ConfigurationManager>, Error> ConfigurationManager::Create(const std::string& config_file,
                                                                                  const std::string& schema_file) {
  auto config_result = config::LoadConfig(config_file, schema_file);
  if (!config_result) {
    return MakeUnexpected(config_result.error());
  }

  auto manager = std::unique_ptr<ConfigurationManager>(
      new ConfigurationManager(config_file, schema_file, std::move(*config_result)));

  return manager;
}

ConfigurationManager::ConfigurationManager(std::string config_file, std::string schema_file,
                                           config::Config initial_config)
    : config_file_(std::move(config_file)), schema_file_(std::move(schema_file)), config_(std::move(initial_config)) {}

int ConfigurationManager::PrintConfigTest() const {
  std::cout << "Configuration file syntax is OK\n";
  std::cout << "Configuration details:\n";
  std::cout << "  Source: " << config_.source.type << "\n";
  if (config_.source.type == "mysql") {
    const auto& mysql = config_.source.mysql;
    std::cout << "    MySQL: " << mysql.user << "@" << mysql.host << ":" << mysql.port << "/" << mysql.database
              << " (table: " << mysql.table << ")\n";
  } else {
    std::cout << "    CSV: " << config_.source.csv_path << "\n";
  }
  std::cout << "  Generator: max_count " << config_.generator.max_count << ", workers "
            << (config_.generator.workers == 0 ? std::string("auto") : std::to_string(config_.generator.workers))
            << ", file size limit "
            << utils::FormatFileSize(static_cast<size_t>(config_.generator.file_size_limit_bytes)) << "\n";
  std::cout << "  Output: " << config_.output.dir << " (expire after " << config_.output.expire_hours << "h)\n";
  std::cout << "  Logging level: " << config_.logging.level << " (" << config_.logging.format << ")\n";
  return 0;
}

Expected<void, Error> ConfigurationManager::ApplyLoggingConfig() {
  // Configure log output BEFORE setting level
  try {
    if (!config_.logging.file.empty()) {
      std::filesystem::path log_path(config_.logging.file);
      std::filesystem::path log_dir = log_path.parent_path();
      if (!log_dir.empty() && !std::filesystem::exists(log_dir)) {
        std::filesystem::create_directories(log_dir);
      }
      spdlog::drop(kLoggerName);
      auto file_logger = spdlog::basic_logger_mt(kLoggerName, config_.logging.file);
      spdlog::set_default_logger(file_logger);
    } else {
      spdlog::drop(kLoggerName);
      auto stderr_logger = spdlog::stderr_color_mt(kLoggerName);
      spdlog::set_default_logger(stderr_logger);
    }
  } catch (const spdlog::spdlog_ex& ex) {
    return MakeUnexpected(MakeError(ErrorCode::kIOError, "Log file initialization failed: " + std::string(ex.what())));
  } catch (const std::exception& ex) {
    return MakeUnexpected(
        MakeError(ErrorCode::kIOError, "Failed to create log directory: " + std::string(ex.what())));
  }

  // Must come AFTER setting the default logger
  spdlog::set_level(spdlog::level::from_str(config_.logging.level));

  utils::StructuredLog::SetFormat(utils::StructuredLog::ParseFormat(config_.logging.format));

  if (!config_.logging.file.empty()) {
    spdlog::info("Logging to file: {}", config_.logging.file);
  }

  return {};
}

}  // namespace phonegen::app
