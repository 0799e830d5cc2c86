/**
 * @file mysql_record_loader.h
 * @brief Record loader reading the attribution table from MySQL
 */

#pragma once

#ifdef USE_MYSQL

#include <string>
#include <vector>

#include "loader/record_loader.h"
#include "mysql/connection.h"

namespace phonegen::loader {

/**
 * @brief Loads records with
 *        SELECT prefix, suffix, province, city, operator FROM <table>
 *
 * Rows with NULL or malformed fields are skipped and counted.
 */
class MysqlRecordLoader : public RecordLoader {
 public:
  /**
   * @param connection Connected MySQL connection (must outlive the loader)
   * @param table Table name (letters, digits and '_' only)
   */
  MysqlRecordLoader(mysql::Connection& connection, std::string table);

  [[nodiscard]] utils::Expected<std::vector<index::GeoOperatorRecord>, utils::Error> Load() override;

  [[nodiscard]] std::string Describe() const override;

  /**
   * @brief Build the SELECT statement, or kInvalidArgument for a bad table name
   */
  [[nodiscard]] static utils::Expected<std::string, utils::Error> BuildSelectQuery(const std::string& table);

 private:
  mysql::Connection& connection_;
  std::string table_;
};

}  // namespace phonegen::loader

#endif  // USE_MYSQL
