/**
 * @file enumeration_plan.h
 * @brief Deterministic description of a number enumeration
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "index/geo_operator_record.h"

namespace phonegen::plan {

/**
 * @brief All four trailing digits fixed (one variant per record)
 */
struct FixedTrailing {
  std::string digits;  // 4 digits
};

/**
 * @brief Last three digits fixed, the digit before them free (ten variants)
 *
 * The free digit is the HIGH digit of the trailing four: variant v renders as
 * v followed by the three fixed digits ("567" -> 0567, 1567, ... 9567). The
 * three fixed digits are never followed by a free low digit.
 */
struct FixedHighDigitTrailing {
  std::string digits;  // 3 digits
};

/**
 * @brief All four trailing digits free (0000-9999)
 */
struct FreeTrailing {};

using TrailingRule = std::variant<FixedTrailing, FixedHighDigitTrailing, FreeTrailing>;

/**
 * @brief Number of trailing variants per candidate record: 1, 10 or 10000
 */
uint64_t VariantsPerRecord(const TrailingRule& rule);

/**
 * @brief Write the four trailing digits of a variant
 *
 * Variants are ordered by ascending numeric value of the trailing digits.
 *
 * @param rule Trailing rule
 * @param variant_index Index in [0, VariantsPerRecord(rule))
 * @param out Destination for exactly four characters
 */
void WriteTrailingDigits(const TrailingRule& rule, uint64_t variant_index, char* out);

/**
 * @brief Short label of the trailing constraint: the fixed digits or "ALL"
 */
std::string TrailingLabel(const TrailingRule& rule);

/**
 * @brief Validated, fully deterministic enumeration plan
 *
 * The enumerated sequence is the cross product of candidates (outer, in
 * stored order) and trailing variants (inner, ascending).
 */
struct EnumerationPlan {
  std::string prefix;
  std::vector<index::GeoOperatorRecord> candidates;  // sorted by middle segment, then operator code
  TrailingRule trailing_rule = FreeTrailing{};
  uint64_t total_count = 0;  // candidates.size() * VariantsPerRecord(trailing_rule)
};

}  // namespace phonegen::plan
