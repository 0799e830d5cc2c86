/**
 * @file config.h
 * @brief Configuration structures and YAML/JSON loader
 */

#pragma once

#include <cstdint>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace phonegen::config {

// Default values for configuration
namespace defaults {

// Generator defaults
constexpr uint64_t kMaxCount = 10000000;
constexpr uint64_t kFileSizeLimitBytes = 20ULL * 1024 * 1024;
constexpr const char* kNameTemplate = "{prefix}_{province}_{city}_{suffix}_{timestamp}";

// Source defaults
constexpr const char* kSourceType = "csv";
constexpr const char* kCsvPath = "phone_location.csv";
constexpr const char* kMysqlTable = "phone_location";
constexpr int kMysqlPort = 3306;
constexpr int kMysqlConnectTimeoutMs = 3000;

// Output defaults
constexpr const char* kOutputDir = "downloads";
constexpr int kExpireHours = 24;

}  // namespace defaults

/**
 * @brief Enumeration and output limits
 */
struct GeneratorConfig {
  uint64_t max_count = defaults::kMaxCount;  // ceiling on numbers per request
  uint32_t workers = 0;                      // 0 = number of CPU cores
  uint64_t file_size_limit_bytes = defaults::kFileSizeLimitBytes;
  std::string name_template = defaults::kNameTemplate;
};

/**
 * @brief MySQL connection configuration
 */
struct MysqlConfig {
  std::string host = "127.0.0.1";
  int port = defaults::kMysqlPort;
  std::string user;
  std::string password;
  std::string database;
  std::string table = defaults::kMysqlTable;
  int connect_timeout_ms = defaults::kMysqlConnectTimeoutMs;
};

/**
 * @brief Attribution record source
 */
struct SourceConfig {
  std::string type = defaults::kSourceType;  // "csv" or "mysql"
  std::string csv_path = defaults::kCsvPath;
  MysqlConfig mysql;
};

/**
 * @brief Output directory and retention
 */
struct OutputConfig {
  std::string dir = defaults::kOutputDir;
  int expire_hours = defaults::kExpireHours;
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";
  std::string format = "json";  // "json" or "text"
  std::string file;             // empty = stderr
};

/**
 * @brief Root configuration
 */
struct Config {
  GeneratorConfig generator;
  SourceConfig source;
  OutputConfig output;
  LoggingConfig logging;
};

/**
 * @brief Load configuration from YAML or JSON file
 *
 * The format is detected from the extension (.yaml, .yml, .json). The
 * document is validated against the embedded JSON Schema, or against
 * schema_path when given.
 *
 * @param path Path to configuration file
 * @param schema_path Optional JSON Schema file overriding the embedded one
 * @return Configuration, or kConfigFileNotFound / kConfigParseError /
 *         kConfigValidationError
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path, const std::string& schema_path = "");

/**
 * @brief Parse configuration from a JSON string (validated like LoadConfig)
 */
utils::Expected<Config, utils::Error> ParseConfigString(const std::string& json_text,
                                                        const std::string& schema_json_str = "");

/**
 * @brief Validate JSON configuration against schema
 *
 * @param config_json_str JSON configuration string
 * @param schema_json_str JSON Schema string (empty = embedded schema)
 */
utils::Expected<void, utils::Error> ValidateConfigJson(const std::string& config_json_str,
                                                       const std::string& schema_json_str);

}  // namespace phonegen::config
