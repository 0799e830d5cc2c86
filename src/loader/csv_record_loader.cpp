/**
 * @file csv_record_loader.cpp
 * @brief CSV record loader implementation
 */

#include "loader/csv_record_loader.h"

#include <filesystem>
#include <fstream>
#include <utility>

#include "utils/structured_log.h"

namespace phonegen::loader {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr size_t kExpectedColumns = 5;

}  // namespace

CsvRecordLoader::CsvRecordLoader(std::string path) : path_(std::move(path)) {}

std::vector<std::string> CsvRecordLoader::SplitCsvLine(const std::string& line) {
  std::vector<std::string> fields;
  std::string field;
  bool in_quotes = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char chr = line[i];
    if (in_quotes) {
      if (chr == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(chr);
      }
    } else if (chr == '"') {
      in_quotes = true;
    } else if (chr == ',') {
      fields.push_back(std::move(field));
      field.clear();
    } else {
      field.push_back(chr);
    }
  }
  fields.push_back(std::move(field));
  return fields;
}

utils::Expected<std::vector<index::GeoOperatorRecord>, utils::Error> CsvRecordLoader::Load() {
  stats_ = LoadStats();

  std::error_code error_code;
  if (!std::filesystem::is_regular_file(path_, error_code)) {
    utils::LogSourceError("csv", path_, "file not found");
    return MakeUnexpected(MakeError(ErrorCode::kLoaderFileNotFound, "CSV file not found", path_));
  }

  std::ifstream input(path_, std::ios::binary);
  if (!input) {
    utils::LogSourceError("csv", path_, "cannot open file");
    return MakeUnexpected(MakeError(ErrorCode::kLoaderReadError, "Cannot open CSV file", path_));
  }

  std::string line;
  if (!std::getline(input, line)) {
    utils::LogSourceError("csv", path_, "file is empty");
    return MakeUnexpected(MakeError(ErrorCode::kLoaderReadError, "CSV file is empty (no header row)", path_));
  }

  std::vector<index::GeoOperatorRecord> records;
  uint64_t line_number = 1;
  while (std::getline(input, line)) {
    ++line_number;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    std::vector<std::string> fields = SplitCsvLine(line);
    if (fields.size() != kExpectedColumns) {
      ++stats_.skipped_rows;
      continue;
    }

    auto record = ParseRecordFields(fields[0], fields[1], fields[2], fields[3], fields[4]);
    if (!record) {
      ++stats_.skipped_rows;
      utils::StructuredLog()
          .Event("csv_row_skipped")
          .Field("line", line_number)
          .Field("reason", record.error().message())
          .Debug();
      continue;
    }
    records.push_back(std::move(*record));
    ++stats_.loaded_rows;
  }

  if (input.bad()) {
    utils::LogSourceError("csv", path_, "read error");
    return MakeUnexpected(MakeError(ErrorCode::kLoaderReadError, "Error while reading CSV file", path_));
  }

  utils::StructuredLog()
      .Event("records_loaded")
      .Field("source", Describe())
      .Field("loaded", stats_.loaded_rows)
      .Field("skipped", stats_.skipped_rows)
      .Info();

  return records;
}

}  // namespace phonegen::loader
