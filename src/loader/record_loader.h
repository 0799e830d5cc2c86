/**
 * @file record_loader.h
 * @brief Record source interface
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "index/geo_operator_record.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace phonegen::loader {

/**
 * @brief Counters of the last load
 */
struct LoadStats {
  uint64_t loaded_rows = 0;
  uint64_t skipped_rows = 0;  // wrong column count or malformed field
};

/**
 * @brief Source of attribution records
 *
 * Implementations read the persisted schema
 * (prefix, suffix, province, city, operator) where "suffix" is the middle
 * segment of the number.
 */
class RecordLoader {
 public:
  virtual ~RecordLoader() = default;

  RecordLoader() = default;
  RecordLoader(const RecordLoader&) = delete;
  RecordLoader& operator=(const RecordLoader&) = delete;
  RecordLoader(RecordLoader&&) = delete;
  RecordLoader& operator=(RecordLoader&&) = delete;

  /**
   * @brief Read all records
   */
  [[nodiscard]] virtual utils::Expected<std::vector<index::GeoOperatorRecord>, utils::Error> Load() = 0;

  /**
   * @brief Statistics of the last Load()
   */
  [[nodiscard]] const LoadStats& GetStats() const { return stats_; }

  /**
   * @brief Human-readable source description for logs
   */
  [[nodiscard]] virtual std::string Describe() const = 0;

 protected:
  LoadStats stats_;
};

/**
 * @brief Convert one row of the persisted schema to a record
 *
 * Fields are trimmed. Returns kLookupInvalidRecord if a field is malformed
 * (prefix not 3 digits, segment not 4 digits, empty province or city,
 * operator not 1..5).
 */
utils::Expected<index::GeoOperatorRecord, utils::Error> ParseRecordFields(const std::string& prefix,
                                                                         const std::string& segment,
                                                                         const std::string& province,
                                                                         const std::string& city,
                                                                         const std::string& operator_code);

}  // namespace phonegen::loader
