/**
 * @file geo_operator_record.h
 * @brief Geographic/operator attribution record for a number block
 */

#pragma once

#include <string>

namespace phonegen::index {

/**
 * @brief One row of the attribution table
 *
 * Maps a 3-digit prefix plus a 4-digit middle segment to the province,
 * city and operator that own the block.
 */
struct GeoOperatorRecord {
  std::string prefix;          // 3 digits
  std::string middle_segment;  // 4 digits
  std::string province;
  std::string city;
  int operator_code = 0;  // 1..5

  bool operator==(const GeoOperatorRecord& other) const {
    return prefix == other.prefix && middle_segment == other.middle_segment && province == other.province &&
           city == other.city && operator_code == other.operator_code;
  }

  bool operator!=(const GeoOperatorRecord& other) const { return !(*this == other); }
};

/**
 * @brief Candidate ordering: middle segment, then operator code, then prefix
 */
inline bool CandidateLess(const GeoOperatorRecord& lhs, const GeoOperatorRecord& rhs) {
  if (lhs.middle_segment != rhs.middle_segment) {
    return lhs.middle_segment < rhs.middle_segment;
  }
  if (lhs.operator_code != rhs.operator_code) {
    return lhs.operator_code < rhs.operator_code;
  }
  return lhs.prefix < rhs.prefix;
}

}  // namespace phonegen::index
