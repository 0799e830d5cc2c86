/**
 * @file config.cpp
 * @brief Configuration loader implementation
 */

#include "config/config.h"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>
#include <sstream>

#include "config_schema_embedded.h"  // Auto-generated embedded schema

namespace phonegen::config {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

using json = nlohmann::json;
using nlohmann::json_schema::json_validator;

/**
 * @brief Convert YAML node to JSON object recursively
 *
 * Plain scalars that parse as JSON (numbers, booleans) keep their type;
 * anything else becomes a string.
 */
json YamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return {};
    case YAML::NodeType::Scalar: {
      const std::string& scalar = node.Scalar();
      // quoted scalars carry the non-specific tag "!" and stay strings
      if (node.Tag() == "!") {
        return scalar;
      }
      json parsed = json::parse(scalar, nullptr, false);
      if (parsed.is_discarded() || parsed.is_object() || parsed.is_array()) {
        return scalar;
      }
      return parsed;
    }
    case YAML::NodeType::Sequence: {
      json result = json::array();
      for (const auto& item : node) {
        result.push_back(YamlToJson(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      json result = json::object();
      for (const auto& key_value : node) {
        result[key_value.first.as<std::string>()] = YamlToJson(key_value.second);
      }
      return result;
    }
    default:
      return {};
  }
}

MysqlConfig ParseMysqlConfig(const json& json_obj) {
  MysqlConfig config;

  if (json_obj.contains("host")) {
    config.host = json_obj["host"].get<std::string>();
  }
  if (json_obj.contains("port")) {
    config.port = json_obj["port"].get<int>();
  }
  if (json_obj.contains("user")) {
    config.user = json_obj["user"].get<std::string>();
  }
  if (json_obj.contains("password")) {
    config.password = json_obj["password"].get<std::string>();
  }
  if (json_obj.contains("database")) {
    config.database = json_obj["database"].get<std::string>();
  }
  if (json_obj.contains("table")) {
    config.table = json_obj["table"].get<std::string>();
  }
  if (json_obj.contains("connect_timeout_ms")) {
    config.connect_timeout_ms = json_obj["connect_timeout_ms"].get<int>();
  }

  return config;
}

/**
 * @brief Build Config from a schema-validated document
 */
Config ParseConfigFromJson(const json& root) {
  Config config;

  if (root.contains("generator")) {
    const auto& generator = root["generator"];
    if (generator.contains("max_count")) {
      config.generator.max_count = generator["max_count"].get<uint64_t>();
    }
    if (generator.contains("workers")) {
      config.generator.workers = generator["workers"].get<uint32_t>();
    }
    if (generator.contains("file_size_limit_bytes")) {
      config.generator.file_size_limit_bytes = generator["file_size_limit_bytes"].get<uint64_t>();
    }
    if (generator.contains("name_template")) {
      config.generator.name_template = generator["name_template"].get<std::string>();
    }
  }

  if (root.contains("source")) {
    const auto& source = root["source"];
    if (source.contains("type")) {
      config.source.type = source["type"].get<std::string>();
    }
    if (source.contains("csv_path")) {
      config.source.csv_path = source["csv_path"].get<std::string>();
    }
    if (source.contains("mysql")) {
      config.source.mysql = ParseMysqlConfig(source["mysql"]);
    }
  }

  if (root.contains("output")) {
    const auto& output = root["output"];
    if (output.contains("dir")) {
      config.output.dir = output["dir"].get<std::string>();
    }
    if (output.contains("expire_hours")) {
      config.output.expire_hours = output["expire_hours"].get<int>();
    }
  }

  if (root.contains("logging")) {
    const auto& log = root["logging"];
    if (log.contains("level")) {
      config.logging.level = log["level"].get<std::string>();
    }
    if (log.contains("format")) {
      config.logging.format = log["format"].get<std::string>();
    }
    if (log.contains("file")) {
      config.logging.file = log["file"].get<std::string>();
    }
  }

  return config;
}

/**
 * @brief Read file contents as string
 */
utils::Expected<std::string, utils::Error> ReadFileToString(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigFileNotFound,
                                    "Failed to open configuration file: " + path +
                                        " (check that the file exists and is readable;"
                                        " example config: examples/config.yaml)"));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  std::string content = buffer.str();
  if (content.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigParseError, "Configuration file is empty: " + path));
  }
  return content;
}

// NOLINTNEXTLINE(performance-enum-size)
enum class FileFormat { kYaml, kJson, kUnknown };

constexpr size_t kJsonExtLength = 5;  // ".json"
constexpr size_t kYamlExtLength = 5;  // ".yaml"
constexpr size_t kYmlExtLength = 4;   // ".yml"

FileFormat DetectFileFormat(const std::string& path) {
  if (path.size() >= kJsonExtLength && path.substr(path.size() - kJsonExtLength) == ".json") {
    return FileFormat::kJson;
  }
  if (path.size() >= kYamlExtLength && path.substr(path.size() - kYamlExtLength) == ".yaml") {
    return FileFormat::kYaml;
  }
  if (path.size() >= kYmlExtLength && path.substr(path.size() - kYmlExtLength) == ".yml") {
    return FileFormat::kYaml;
  }
  return FileFormat::kUnknown;
}

/**
 * @brief Parse a file into a JSON document according to its format
 */
utils::Expected<json, utils::Error> ReadDocument(const std::string& path) {
  FileFormat format = DetectFileFormat(path);
  if (format == FileFormat::kUnknown) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigParseError,
                                    "Unknown configuration file format (.yaml, .yml or .json expected)", path));
  }

  auto content = ReadFileToString(path);
  if (!content) {
    return MakeUnexpected(content.error());
  }

  if (format == FileFormat::kJson) {
    spdlog::debug("Detected JSON format for config file: {}", path);
    json document = json::parse(*content, nullptr, false);
    if (document.is_discarded()) {
      return MakeUnexpected(MakeError(ErrorCode::kConfigParseError, "JSON parse error in configuration file", path));
    }
    return document;
  }

  spdlog::debug("Detected YAML format for config file: {}", path);
  try {
    YAML::Node yaml_root = YAML::Load(*content);
    return YamlToJson(yaml_root);
  } catch (const YAML::Exception& e) {
    std::stringstream err_msg;
    err_msg << "YAML parse error: " << e.what();
    if (e.mark.line >= 0) {
      err_msg << " (line " << (e.mark.line + 1) << ", column " << (e.mark.column + 1) << ")";
    }
    return MakeUnexpected(MakeError(ErrorCode::kConfigParseError, err_msg.str(), path));
  }
}

utils::Expected<Config, utils::Error> BuildConfig(const json& document, const std::string& schema_str) {
  auto valid = ValidateConfigJson(document.dump(), schema_str);
  if (!valid) {
    return MakeUnexpected(valid.error());
  }
  try {
    return ParseConfigFromJson(document);
  } catch (const json::exception& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigValidationError, std::string("Invalid value: ") + e.what()));
  }
}

}  // namespace

utils::Expected<void, utils::Error> ValidateConfigJson(const std::string& config_json_str,
                                                       const std::string& schema_json_str) {
  json config_json = json::parse(config_json_str, nullptr, false);
  if (config_json.is_discarded()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigParseError, "Configuration is not valid JSON"));
  }

  // Use embedded schema if no custom schema provided
  std::string schema_to_use = schema_json_str.empty() ? std::string(kConfigSchemaJson) : schema_json_str;
  json schema_json = json::parse(schema_to_use, nullptr, false);
  if (schema_json.is_discarded()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigParseError, "Configuration schema is not valid JSON"));
  }

  try {
    json_validator validator;
    validator.set_root_schema(schema_json);
    validator.validate(config_json);
  } catch (const std::exception& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigValidationError,
                                    std::string("Configuration validation failed: ") + e.what()));
  }

  spdlog::debug("Configuration validation passed");
  return {};
}

utils::Expected<Config, utils::Error> ParseConfigString(const std::string& json_text,
                                                        const std::string& schema_json_str) {
  json document = json::parse(json_text, nullptr, false);
  if (document.is_discarded()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigParseError, "Configuration is not valid JSON"));
  }
  return BuildConfig(document, schema_json_str);
}

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path, const std::string& schema_path) {
  auto document = ReadDocument(path);
  if (!document) {
    return MakeUnexpected(document.error());
  }

  std::string schema_str;
  if (!schema_path.empty()) {
    auto schema = ReadFileToString(schema_path);
    if (!schema) {
      return MakeUnexpected(schema.error());
    }
    schema_str = std::move(*schema);
  }

  auto config = BuildConfig(*document, schema_str);
  if (!config) {
    return MakeUnexpected(MakeError(config.error().code(), config.error().message(), path));
  }

  spdlog::info("Configuration loaded successfully from {}", path);
  spdlog::info("  Source: {}", config->source.type == "mysql"
                                   ? "mysql " + config->source.mysql.host + ":" +
                                         std::to_string(config->source.mysql.port) + "/" +
                                         config->source.mysql.database
                                   : "csv " + config->source.csv_path);
  spdlog::info("  Output: {} (limit {} bytes/file, ceiling {})", config->output.dir,
               config->generator.file_size_limit_bytes, config->generator.max_count);

  return config;
}

}  // namespace phonegen::config
