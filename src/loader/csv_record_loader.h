/**
 * @file csv_record_loader.h
 * @brief Record loader for CSV exports of the attribution table
 */

#pragma once

#include <string>
#include <vector>

#include "loader/record_loader.h"

namespace phonegen::loader {

/**
 * @brief Loads records from a CSV file
 *
 * The first line is a header and is skipped. Data rows must have exactly
 * five columns in the order prefix, suffix, province, city, operator; other
 * rows, and rows with malformed fields, are skipped and counted. Fields may
 * be double-quoted, with "" as an escaped quote.
 */
class CsvRecordLoader : public RecordLoader {
 public:
  explicit CsvRecordLoader(std::string path);

  [[nodiscard]] utils::Expected<std::vector<index::GeoOperatorRecord>, utils::Error> Load() override;

  [[nodiscard]] std::string Describe() const override { return "csv:" + path_; }

  /**
   * @brief Split one CSV line into fields
   */
  static std::vector<std::string> SplitCsvLine(const std::string& line);

 private:
  std::string path_;
};

}  // namespace phonegen::loader
