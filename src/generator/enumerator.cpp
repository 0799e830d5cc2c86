/**
 * @file enumerator.cpp
 * @brief Enumerator implementation
 */

#include "generator/enumerator.h"

#include <array>

#include "utils/constants.h"

namespace phonegen::generator {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

using NumberBuffer = std::array<char, constants::kNumberDigits>;

constexpr size_t kMiddleOffset = constants::kPrefixDigits;
constexpr size_t kTrailingOffset = constants::kPrefixDigits + constants::kMiddleSegmentDigits;

}  // namespace

utils::Expected<void, utils::Error> Enumerator::CheckRange(const plan::EnumerationPlan& plan, uint64_t start_offset,
                                                           uint64_t end_offset) {
  if (start_offset > end_offset || end_offset > plan.total_count) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                    "Invalid enumeration range [" + std::to_string(start_offset) + ", " +
                                        std::to_string(end_offset) + ") for plan of " +
                                        std::to_string(plan.total_count)));
  }
  return {};
}

template <typename Sink>
void Enumerator::ForEachInRange(const plan::EnumerationPlan& plan, uint64_t start_offset, uint64_t end_offset,
                                Sink&& sink) {
  if (start_offset >= end_offset) {
    return;
  }

  const uint64_t variants = plan::VariantsPerRecord(plan.trailing_rule);
  uint64_t record_index = start_offset / variants;
  uint64_t variant_index = start_offset % variants;

  NumberBuffer number{};
  plan.prefix.copy(number.data(), constants::kPrefixDigits);
  plan.candidates[record_index].middle_segment.copy(number.data() + kMiddleOffset, constants::kMiddleSegmentDigits);

  for (uint64_t offset = start_offset; offset < end_offset; ++offset) {
    plan::WriteTrailingDigits(plan.trailing_rule, variant_index, number.data() + kTrailingOffset);
    sink(number);

    if (++variant_index == variants && offset + 1 < end_offset) {
      variant_index = 0;
      ++record_index;
      plan.candidates[record_index].middle_segment.copy(number.data() + kMiddleOffset,
                                                        constants::kMiddleSegmentDigits);
    }
  }
}

std::string Enumerator::NumberAt(const plan::EnumerationPlan& plan, uint64_t offset) {
  std::string result;
  ForEachInRange(plan, offset, offset + 1,
                 [&result](const NumberBuffer& number) { result.assign(number.data(), number.size()); });
  return result;
}

utils::Expected<std::vector<std::string>, utils::Error> Enumerator::GenerateRange(const plan::EnumerationPlan& plan,
                                                                                 uint64_t start_offset,
                                                                                 uint64_t end_offset) {
  auto range_check = CheckRange(plan, start_offset, end_offset);
  if (!range_check) {
    return MakeUnexpected(range_check.error());
  }

  std::vector<std::string> numbers;
  numbers.reserve(end_offset - start_offset);
  ForEachInRange(plan, start_offset, end_offset,
                 [&numbers](const NumberBuffer& number) { numbers.emplace_back(number.data(), number.size()); });
  return numbers;
}

utils::Expected<uint64_t, utils::Error> Enumerator::AppendRange(const plan::EnumerationPlan& plan,
                                                                uint64_t start_offset, uint64_t end_offset,
                                                                std::string& buffer) {
  auto range_check = CheckRange(plan, start_offset, end_offset);
  if (!range_check) {
    return MakeUnexpected(range_check.error());
  }

  buffer.reserve(buffer.size() + (end_offset - start_offset) * constants::kLineBytes);
  ForEachInRange(plan, start_offset, end_offset, [&buffer](const NumberBuffer& number) {
    buffer.append(number.data(), number.size());
    buffer.push_back('\n');
  });
  return end_offset - start_offset;
}

}  // namespace phonegen::generator
