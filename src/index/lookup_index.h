/**
 * @file lookup_index.h
 * @brief Immutable in-memory index over attribution records
 */

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "index/geo_operator_record.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace phonegen::index {

/**
 * @brief Attribution lookup index
 *
 * Records are grouped by (province, city) and, within a group, by operator
 * code. The index is built once and never mutated afterwards, so a single
 * instance can be shared by reference between any number of concurrent
 * requests.
 */
class LookupIndex {
 public:
  /**
   * @brief Build the index
   *
   * @param records Records from the record source
   * @return Index, or kLookupDuplicateKey if two records share
   *         (prefix, middle_segment), or kLookupInvalidRecord for a record
   *         with a malformed field
   */
  static utils::Expected<std::unique_ptr<LookupIndex>, utils::Error> Build(std::vector<GeoOperatorRecord> records);

  ~LookupIndex() = default;

  LookupIndex(const LookupIndex&) = delete;
  LookupIndex& operator=(const LookupIndex&) = delete;
  LookupIndex(LookupIndex&&) = delete;
  LookupIndex& operator=(LookupIndex&&) = delete;

  /**
   * @brief Records of a region, optionally restricted to operator codes
   *
   * @param province Province name
   * @param city City name
   * @param operator_codes Operator filter, empty = any operator
   * @return Matching records sorted by middle segment, then operator code
   *         (empty if the region has no coverage)
   */
  [[nodiscard]] std::vector<GeoOperatorRecord> Lookup(const std::string& province, const std::string& city,
                                                      const std::set<int>& operator_codes) const;

  /**
   * @brief Same as Lookup(province, city, operator_codes), restricted to one prefix
   */
  [[nodiscard]] std::vector<GeoOperatorRecord> Lookup(const std::string& prefix, const std::string& province,
                                                      const std::string& city,
                                                      const std::set<int>& operator_codes) const;

  /**
   * @brief Distinct provinces in ascending order
   */
  [[nodiscard]] std::vector<std::string> Provinces() const;

  /**
   * @brief Distinct cities of a province in ascending order
   */
  [[nodiscard]] std::vector<std::string> Cities(const std::string& province) const;

  /**
   * @brief Total number of indexed records
   */
  [[nodiscard]] size_t Size() const { return record_count_; }

 private:
  using RegionKey = std::pair<std::string, std::string>;  // (province, city)

  struct RegionGroup {
    std::vector<GeoOperatorRecord> all;                          // sorted with CandidateLess
    std::map<int, std::vector<GeoOperatorRecord>> by_operator;  // each bucket sorted
  };

  LookupIndex() = default;

  std::map<RegionKey, RegionGroup> regions_;
  size_t record_count_ = 0;
};

}  // namespace phonegen::index
