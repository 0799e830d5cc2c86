/**
 * @file enumerator.h
 * @brief Offset-addressed enumeration of a plan
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "plan/enumeration_plan.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace phonegen::generator {

/**
 * @brief Maps plan offsets to numbers
 *
 * Offset i is the (i / v)-th candidate combined with the (i % v)-th trailing
 * variant, v = VariantsPerRecord(plan.trailing_rule). Each offset is
 * evaluated independently of every other, so a range can be split at any
 * point and the pieces evaluated in any order on any thread with identical
 * results. Enumerator holds no state.
 */
class Enumerator {
 public:
  /**
   * @brief Number at one offset
   * @pre offset < plan.total_count
   */
  [[nodiscard]] static std::string NumberAt(const plan::EnumerationPlan& plan, uint64_t offset);

  /**
   * @brief Numbers for offsets [start_offset, end_offset)
   *
   * @return Ordered 11-digit numbers, or kInvalidArgument unless
   *         0 <= start_offset <= end_offset <= plan.total_count
   */
  [[nodiscard]] static utils::Expected<std::vector<std::string>, utils::Error> GenerateRange(
      const plan::EnumerationPlan& plan, uint64_t start_offset, uint64_t end_offset);

  /**
   * @brief Append the range to a buffer as newline-terminated lines
   *
   * Same sequence as GenerateRange without materialising one string per
   * number.
   *
   * @return Number of lines appended, or kInvalidArgument for a bad range
   */
  [[nodiscard]] static utils::Expected<uint64_t, utils::Error> AppendRange(const plan::EnumerationPlan& plan,
                                                                           uint64_t start_offset,
                                                                           uint64_t end_offset, std::string& buffer);

 private:
  Enumerator() = default;

  static utils::Expected<void, utils::Error> CheckRange(const plan::EnumerationPlan& plan, uint64_t start_offset,
                                                        uint64_t end_offset);

  /**
   * @brief Visit numbers of the range in order as 11-char arrays
   */
  template <typename Sink>
  static void ForEachInRange(const plan::EnumerationPlan& plan, uint64_t start_offset, uint64_t end_offset,
                             Sink&& sink);
};

}  // namespace phonegen::generator
