/**
 * @file connection.h
 * @brief MySQL connection wrapper
 */

#pragma once

#ifdef USE_MYSQL

#include <mysql.h>

#include <cstdint>
#include <memory>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace phonegen::mysql {

/**
 * @brief RAII wrapper for MYSQL_RES*
 */
struct MySQLResultDeleter {
  void operator()(MYSQL_RES* res) const {
    if (res != nullptr) {
      mysql_free_result(res);
    }
  }
};

using MySQLResult = std::unique_ptr<MYSQL_RES, MySQLResultDeleter>;

/**
 * @brief MySQL connection wrapper
 *
 * Owns the MYSQL handle; the connection is closed on destruction.
 */
class Connection {
 public:
  // NOLINTBEGIN(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers) - Default MySQL
  // connection settings
  struct Config {
    std::string host = "localhost";
    uint16_t port = 3306;
    std::string user;
    std::string password;
    std::string database;
    uint32_t connect_timeout = 10;  // seconds
    uint32_t read_timeout = 30;     // seconds
  };
  // NOLINTEND(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers)

  explicit Connection(Config config);

  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  Connection(Connection&& other) noexcept;
  Connection& operator=(Connection&& other) noexcept;

  /**
   * @brief Connect to the server
   * @return kMySQLConnectionFailed on failure
   */
  [[nodiscard]] utils::Expected<void, utils::Error> Connect();

  [[nodiscard]] bool IsConnected() const;

  void Close();

  /**
   * @brief Execute a query returning a result set
   * @return Result set (freed automatically), or kMySQLQueryFailed /
   *         kMySQLDisconnected
   */
  [[nodiscard]] utils::Expected<MySQLResult, utils::Error> Execute(const std::string& query);

  [[nodiscard]] const std::string& GetLastError() const { return last_error_; }

  [[nodiscard]] const Config& GetConfig() const { return config_; }

 private:
  Config config_;
  MYSQL* mysql_ = nullptr;
  std::string last_error_;

  void SetMySQLError();
};

}  // namespace phonegen::mysql

#endif  // USE_MYSQL
