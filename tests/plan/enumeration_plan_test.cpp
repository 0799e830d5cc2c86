/**
 * @file enumeration_plan_test.cpp
 * @brief Unit tests for trailing rule helpers
 */

#include "plan/enumeration_plan.h"

#include <gtest/gtest.h>

#include <string>

using namespace phonegen::plan;

namespace {

std::string Trailing(const TrailingRule& rule, uint64_t variant) {
  std::string out(4, '?');
  WriteTrailingDigits(rule, variant, out.data());
  return out;
}

}  // namespace

TEST(EnumerationPlanTest, VariantsPerRecord) {
  EXPECT_EQ(VariantsPerRecord(FixedTrailing{"1234"}), 1U);
  EXPECT_EQ(VariantsPerRecord(FixedHighDigitTrailing{"567"}), 10U);
  EXPECT_EQ(VariantsPerRecord(FreeTrailing{}), 10000U);
}

TEST(EnumerationPlanTest, FixedTrailingDigits) {
  EXPECT_EQ(Trailing(FixedTrailing{"1234"}, 0), "1234");
}

/**
 * @brief The free digit precedes the three fixed digits
 */
TEST(EnumerationPlanTest, FixedHighDigitTrailingDigits) {
  TrailingRule rule = FixedHighDigitTrailing{"567"};
  EXPECT_EQ(Trailing(rule, 0), "0567");
  EXPECT_EQ(Trailing(rule, 1), "1567");
  EXPECT_EQ(Trailing(rule, 9), "9567");
}

TEST(EnumerationPlanTest, FreeTrailingDigitsArePadded) {
  TrailingRule rule = FreeTrailing{};
  EXPECT_EQ(Trailing(rule, 0), "0000");
  EXPECT_EQ(Trailing(rule, 42), "0042");
  EXPECT_EQ(Trailing(rule, 9999), "9999");
}

TEST(EnumerationPlanTest, TrailingLabel) {
  EXPECT_EQ(TrailingLabel(FixedTrailing{"1234"}), "1234");
  EXPECT_EQ(TrailingLabel(FixedHighDigitTrailing{"567"}), "567");
  EXPECT_EQ(TrailingLabel(FreeTrailing{}), "ALL");
}
