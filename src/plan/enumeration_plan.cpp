/**
 * @file enumeration_plan.cpp
 * @brief Trailing rule helpers
 */

#include "plan/enumeration_plan.h"

#include <type_traits>

namespace phonegen::plan {

namespace {

constexpr uint64_t kFreeVariants = 10000;
constexpr uint64_t kHighDigitVariants = 10;

}  // namespace

uint64_t VariantsPerRecord(const TrailingRule& rule) {
  return std::visit(
      [](const auto& alternative) -> uint64_t {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, FixedTrailing>) {
          return 1;
        } else if constexpr (std::is_same_v<T, FixedHighDigitTrailing>) {
          return kHighDigitVariants;
        } else {
          return kFreeVariants;
        }
      },
      rule);
}

void WriteTrailingDigits(const TrailingRule& rule, uint64_t variant_index, char* out) {
  std::visit(
      [variant_index, out](const auto& alternative) {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, FixedTrailing>) {
          alternative.digits.copy(out, 4);
        } else if constexpr (std::is_same_v<T, FixedHighDigitTrailing>) {
          out[0] = static_cast<char>('0' + variant_index);
          alternative.digits.copy(out + 1, 3);
        } else {
          uint64_t value = variant_index;
          for (int pos = 3; pos >= 0; --pos) {
            out[pos] = static_cast<char>('0' + value % 10);
            value /= 10;
          }
        }
      },
      rule);
}

std::string TrailingLabel(const TrailingRule& rule) {
  if (const auto* fixed = std::get_if<FixedTrailing>(&rule)) {
    return fixed->digits;
  }
  if (const auto* high_digit = std::get_if<FixedHighDigitTrailing>(&rule)) {
    return high_digit->digits;
  }
  return "ALL";
}

}  // namespace phonegen::plan
