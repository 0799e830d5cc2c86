/**
 * @file application.cpp
 * @brief Main application class implementation
 */

#include "app/application.h"

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

#include "loader/csv_record_loader.h"
#include "output/artifact_cleaner.h"
#include "service/generation_service.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"
#include "version.h"

#ifdef USE_MYSQL
#include "loader/mysql_record_loader.h"
#include "mysql/connection.h"
#endif

namespace phonegen::app {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr int kJsonIndent = 2;
constexpr int kMillisecondsPerSecond = 1000;

void LogApplicationError(const std::string& type, const std::string& phase, const Error& error) {
  utils::StructuredLog()
      .Event("application_error")
      .Field("type", type)
      .Field("phase", phase)
      .Field("error", error.to_string())
      .Error();
}

nlohmann::json ErrorResponse(const Error& error) {
  nlohmann::json response;
  response["code"] = service::kResponseInternalError;
  response["message"] = error.message();
  response["data"] = {{"error_code", static_cast<int32_t>(error.code())}};
  return response;
}

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<std::unique_ptr<Application>, Error> Application::Create(int argc, char* argv[]) {
  auto args_result = CommandLineParser::Parse(argc, argv);
  if (!args_result) {
    return MakeUnexpected(args_result.error());
  }

  CommandLineArgs args = std::move(*args_result);

  if (args.show_help) {
    CommandLineParser::PrintHelp(argv[0]);  // NOLINT
    auto app = std::unique_ptr<Application>(new Application(std::move(args), nullptr));
    return app;
  }

  if (args.show_version) {
    CommandLineParser::PrintVersion();
    auto app = std::unique_ptr<Application>(new Application(std::move(args), nullptr));
    return app;
  }

  auto config_mgr = ConfigurationManager::Create(args.config_file, args.schema_file);
  if (!config_mgr) {
    return MakeUnexpected(config_mgr.error());
  }

  auto app = std::unique_ptr<Application>(new Application(std::move(args), std::move(*config_mgr)));
  return app;
}

Application::Application(CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr)
    : args_(std::move(args)), config_manager_(std::move(config_mgr)) {}

int Application::Run(std::ostream& out) {
  int special_exit_code = HandleSpecialModes();
  if (special_exit_code >= 0) {
    return special_exit_code;
  }

  auto logging_result = config_manager_->ApplyLoggingConfig();
  if (!logging_result) {
    LogApplicationError("logging_config_failed", "startup", logging_result.error());
    return 1;
  }

  spdlog::info("{} starting...", Version::FullString());

  if (args_.operation == Operation::kCleanup) {
    return RunCleanup(out);
  }

  auto index = BuildIndex();
  if (!index) {
    LogApplicationError("index_build_failed", "startup", index.error());
    out << ErrorResponse(index.error()).dump(kJsonIndent) << "\n";
    return 1;
  }

  switch (args_.operation) {
    case Operation::kListProvinces:
      out << service::ListResponse((*index)->Provinces()).dump(kJsonIndent) << "\n";
      return 0;
    case Operation::kListCities:
      out << service::ListResponse((*index)->Cities(utils::Trim(args_.list_province))).dump(kJsonIndent) << "\n";
      return 0;
    case Operation::kGenerate:
      return RunGenerate(**index, out);
    default:
      LogApplicationError("no_operation", "dispatch", MakeError(ErrorCode::kInvalidArgument, "No operation given"));
      return 1;
  }
}

int Application::HandleSpecialModes() {
  // Help and version were printed in Create()
  if (args_.show_help || args_.show_version) {
    return 0;
  }

  if (args_.config_test_mode) {
    return config_manager_->PrintConfigTest();
  }

  return -1;
}

Expected<std::unique_ptr<index::LookupIndex>, Error> Application::BuildIndex() const {
  const config::SourceConfig& source = config_manager_->GetConfig().source;

  Expected<std::vector<index::GeoOperatorRecord>, Error> records;
  if (source.type == "mysql") {
#ifdef USE_MYSQL
    mysql::Connection::Config conn_config;
    conn_config.host = source.mysql.host;
    conn_config.port = static_cast<uint16_t>(source.mysql.port);
    conn_config.user = source.mysql.user;
    conn_config.password = source.mysql.password;
    conn_config.database = source.mysql.database;
    conn_config.connect_timeout =
        static_cast<uint32_t>((source.mysql.connect_timeout_ms + kMillisecondsPerSecond - 1) / kMillisecondsPerSecond);

    mysql::Connection connection(conn_config);
    auto connected = connection.Connect();
    if (!connected) {
      return MakeUnexpected(connected.error());
    }
    loader::MysqlRecordLoader loader(connection, source.mysql.table);
    records = loader.Load();
#else
    return MakeUnexpected(
        MakeError(ErrorCode::kNotImplemented, "MySQL record source requested but MySQL support is not compiled in"));
#endif
  } else {
    loader::CsvRecordLoader loader(source.csv_path);
    records = loader.Load();
  }

  if (!records) {
    return MakeUnexpected(records.error());
  }
  return index::LookupIndex::Build(std::move(*records));
}

int Application::RunGenerate(const index::LookupIndex& index, std::ostream& out) {
  service::GenerationService generation_service(
      index, service::GenerationOptions::FromConfig(config_manager_->GetConfig()));

  auto result = generation_service.Generate(args_.request);
  if (!result) {
    LogApplicationError("generation_failed", "generate", result.error().error);
    out << result.error().ToJson().dump(kJsonIndent) << "\n";
    return 1;
  }

  out << result->ToJson().dump(kJsonIndent) << "\n";
  return 0;
}

int Application::RunCleanup(std::ostream& out) {
  const config::OutputConfig& output = config_manager_->GetConfig().output;
  output::ArtifactCleaner cleaner(output.dir, static_cast<uint32_t>(output.expire_hours));

  auto removed = cleaner.CleanupExpired();
  if (!removed) {
    LogApplicationError("cleanup_failed", "cleanup", removed.error());
    out << ErrorResponse(removed.error()).dump(kJsonIndent) << "\n";
    return 1;
  }

  nlohmann::json response;
  response["code"] = service::kResponseOk;
  response["message"] = "Cleanup finished";
  response["data"] = {{"removed", *removed}};
  out << response.dump(kJsonIndent) << "\n";
  return 0;
}

}  // namespace phonegen::app
