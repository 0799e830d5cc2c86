/**
 * @file connection.cpp
 * @brief MySQL connection wrapper implementation
 */

#include "mysql/connection.h"

#ifdef USE_MYSQL

#include <spdlog/spdlog.h>

#include <utility>

namespace phonegen::mysql {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

Connection::Connection(Config config) : config_(std::move(config)), mysql_(mysql_init(nullptr)) {
  if (mysql_ == nullptr) {
    last_error_ = "Failed to initialize MySQL handle";
  }
}

Connection::~Connection() {
  Close();
}

Connection::Connection(Connection&& other) noexcept
    : config_(std::move(other.config_)), mysql_(other.mysql_), last_error_(std::move(other.last_error_)) {
  other.mysql_ = nullptr;
}

Connection& Connection::operator=(Connection&& other) noexcept {
  if (this != &other) {
    Close();
    config_ = std::move(other.config_);
    mysql_ = other.mysql_;
    last_error_ = std::move(other.last_error_);
    other.mysql_ = nullptr;
  }
  return *this;
}

utils::Expected<void, utils::Error> Connection::Connect() {
  if (mysql_ == nullptr) {
    last_error_ = "MySQL handle not initialized";
    return MakeUnexpected(MakeError(ErrorCode::kMySQLConnectionFailed, last_error_));
  }

  mysql_options(mysql_, MYSQL_OPT_CONNECT_TIMEOUT, &config_.connect_timeout);
  mysql_options(mysql_, MYSQL_OPT_READ_TIMEOUT, &config_.read_timeout);

  if (mysql_real_connect(mysql_, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                         config_.database.empty() ? nullptr : config_.database.c_str(), config_.port, nullptr,
                         0) == nullptr) {
    SetMySQLError();
    spdlog::error("MySQL connection failed: {}", last_error_);
    return MakeUnexpected(MakeError(ErrorCode::kMySQLConnectionFailed, last_error_,
                                    config_.host + ":" + std::to_string(config_.port)));
  }

  // utf8mb4 so that province and city names arrive unmangled
  if (mysql_set_character_set(mysql_, "utf8mb4") != 0) {
    SetMySQLError();
    spdlog::warn("Failed to set utf8mb4 character set: {}", last_error_);
  }

  std::string db_info = config_.database.empty() ? "" : "/" + config_.database;
  spdlog::info("Connected to MySQL {}:{}{}", config_.host, config_.port, db_info);
  return {};
}

bool Connection::IsConnected() const {
  if (mysql_ == nullptr) {
    return false;
  }
  // thread_id is 0 until a connection has been established
  return mysql_thread_id(mysql_) != 0;
}

void Connection::Close() {
  if (mysql_ != nullptr) {
    mysql_close(mysql_);
    mysql_ = nullptr;
    spdlog::debug("MySQL connection closed");
  }
}

utils::Expected<MySQLResult, utils::Error> Connection::Execute(const std::string& query) {
  if (mysql_ == nullptr || !IsConnected()) {
    last_error_ = "Not connected";
    return MakeUnexpected(MakeError(ErrorCode::kMySQLDisconnected, last_error_));
  }

  spdlog::debug("Executing query: {}", query);

  if (mysql_query(mysql_, query.c_str()) != 0) {
    SetMySQLError();
    spdlog::error("Query failed: {}", last_error_);
    return MakeUnexpected(MakeError(ErrorCode::kMySQLQueryFailed, last_error_, query));
  }

  MYSQL_RES* result = mysql_store_result(mysql_);
  if (result == nullptr) {
    if (mysql_field_count(mysql_) > 0) {
      SetMySQLError();
    } else {
      last_error_ = "Query returned no result set";
    }
    spdlog::error("Failed to store result: {}", last_error_);
    return MakeUnexpected(MakeError(ErrorCode::kMySQLQueryFailed, last_error_, query));
  }

  return MySQLResult(result);
}

void Connection::SetMySQLError() {
  if (mysql_ != nullptr) {
    last_error_ = mysql_error(mysql_);
  }
}

}  // namespace phonegen::mysql

#endif  // USE_MYSQL
