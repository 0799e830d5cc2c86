/**
 * @file filter_request.h
 * @brief Generation request as submitted by a caller
 */

#pragma once

#include <optional>
#include <set>
#include <string>

namespace phonegen::plan {

/**
 * @brief Unvalidated generation request
 *
 * Field values are taken as submitted; ConstraintResolver trims and
 * validates them.
 */
struct FilterRequest {
  std::string prefix;                          // 3 digits
  std::optional<std::string> trailing_fixed4;  // last 4 digits
  std::optional<std::string> trailing_fixed3;  // last 3 digits, exclusive with trailing_fixed4
  std::string province;
  std::string city;
  std::set<int> operator_codes;  // empty = any operator
};

}  // namespace phonegen::plan
