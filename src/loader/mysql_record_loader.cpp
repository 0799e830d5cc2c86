/**
 * @file mysql_record_loader.cpp
 * @brief MySQL record loader implementation
 */

#include "loader/mysql_record_loader.h"

#ifdef USE_MYSQL

#include <chrono>
#include <utility>

#include "utils/structured_log.h"

namespace phonegen::loader {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr unsigned int kSelectedColumns = 5;

bool IsValidIdentifier(const std::string& name) {
  if (name.empty()) {
    return false;
  }
  for (char chr : name) {
    bool is_alpha = (chr >= 'a' && chr <= 'z') || (chr >= 'A' && chr <= 'Z');
    bool is_digit = chr >= '0' && chr <= '9';
    if (!is_alpha && !is_digit && chr != '_') {
      return false;
    }
  }
  return true;
}

}  // namespace

MysqlRecordLoader::MysqlRecordLoader(mysql::Connection& connection, std::string table)
    : connection_(connection), table_(std::move(table)) {}

std::string MysqlRecordLoader::Describe() const {
  const auto& config = connection_.GetConfig();
  return "mysql:" + config.host + ":" + std::to_string(config.port) + "/" + config.database + "." + table_;
}

utils::Expected<std::string, utils::Error> MysqlRecordLoader::BuildSelectQuery(const std::string& table) {
  if (!IsValidIdentifier(table)) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid table name: '" + table + "'"));
  }
  return "SELECT prefix, suffix, province, city, operator FROM `" + table + "`";
}

utils::Expected<std::vector<index::GeoOperatorRecord>, utils::Error> MysqlRecordLoader::Load() {
  stats_ = LoadStats();
  auto start_time = std::chrono::steady_clock::now();

  auto query = BuildSelectQuery(table_);
  if (!query) {
    return MakeUnexpected(query.error());
  }

  auto result = connection_.Execute(*query);
  if (!result) {
    utils::LogSourceError("mysql", Describe(), result.error().message());
    return MakeUnexpected(result.error());
  }

  MYSQL_RES* res = result->get();
  if (mysql_num_fields(res) != kSelectedColumns) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLQueryFailed, "Unexpected column count", *query));
  }

  std::vector<index::GeoOperatorRecord> records;
  records.reserve(static_cast<size_t>(mysql_num_rows(res)));

  MYSQL_ROW row = nullptr;
  while ((row = mysql_fetch_row(res)) != nullptr) {
    // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (row[0] == nullptr || row[1] == nullptr || row[2] == nullptr || row[3] == nullptr || row[4] == nullptr) {
      ++stats_.skipped_rows;
      continue;
    }
    auto record = ParseRecordFields(row[0], row[1], row[2], row[3], row[4]);
    // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (!record) {
      ++stats_.skipped_rows;
      continue;
    }
    records.push_back(std::move(*record));
    ++stats_.loaded_rows;
  }

  auto elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time).count();
  utils::StructuredLog()
      .Event("records_loaded")
      .Field("source", Describe())
      .Field("loaded", stats_.loaded_rows)
      .Field("skipped", stats_.skipped_rows)
      .Field("elapsed_ms", static_cast<int64_t>(elapsed_ms))
      .Info();

  return records;
}

}  // namespace phonegen::loader

#endif  // USE_MYSQL
