/**
 * @file constraint_resolver.cpp
 * @brief Constraint resolver implementation
 */

#include "plan/constraint_resolver.h"

#include <optional>

#include "utils/constants.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace phonegen::plan {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

utils::Unexpected<ResolveError> Invalid(const std::string& message) {
  return MakeUnexpected(ResolveError{MakeError(ErrorCode::kPlanValidationError, message), 0});
}

/**
 * @brief Trimmed optional field; blank counts as absent
 */
std::optional<std::string> NormalizeOptional(const std::optional<std::string>& field) {
  if (!field.has_value()) {
    return std::nullopt;
  }
  std::string trimmed = utils::Trim(*field);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

}  // namespace

ConstraintResolver::ConstraintResolver(const index::LookupIndex& index, uint64_t max_count)
    : index_(index), max_count_(max_count) {}

utils::Expected<EnumerationPlan, ResolveError> ConstraintResolver::Validate(const FilterRequest& request) const {
  const std::string prefix = utils::Trim(request.prefix);
  if (prefix.empty()) {
    return Invalid("prefix is required");
  }
  if (!utils::IsDigits(prefix, constants::kPrefixDigits)) {
    return Invalid("prefix must be exactly 3 digits: '" + prefix + "'");
  }

  const std::string province = utils::Trim(request.province);
  if (province.empty()) {
    return Invalid("province is required");
  }
  const std::string city = utils::Trim(request.city);
  if (city.empty()) {
    return Invalid("city is required");
  }

  const auto fixed4 = NormalizeOptional(request.trailing_fixed4);
  const auto fixed3 = NormalizeOptional(request.trailing_fixed3);
  if (fixed4 && fixed3) {
    return Invalid("trailing_fixed4 and trailing_fixed3 are mutually exclusive");
  }
  if (fixed4 && !utils::IsDigits(*fixed4, constants::kTrailingDigits)) {
    return Invalid("trailing_fixed4 must be exactly 4 digits: '" + *fixed4 + "'");
  }
  if (fixed3 && !utils::IsDigits(*fixed3, constants::kTrailingDigits - 1)) {
    return Invalid("trailing_fixed3 must be exactly 3 digits: '" + *fixed3 + "'");
  }

  for (int code : request.operator_codes) {
    if (code < constants::kMinOperatorCode || code > constants::kMaxOperatorCode) {
      return Invalid("invalid operator code: " + std::to_string(code));
    }
  }

  EnumerationPlan plan;
  plan.prefix = prefix;
  if (fixed4) {
    plan.trailing_rule = FixedTrailing{*fixed4};
  } else if (fixed3) {
    plan.trailing_rule = FixedHighDigitTrailing{*fixed3};
  } else {
    plan.trailing_rule = FreeTrailing{};
  }
  plan.candidates = index_.Lookup(prefix, province, city, request.operator_codes);
  plan.total_count = static_cast<uint64_t>(plan.candidates.size()) * VariantsPerRecord(plan.trailing_rule);

  if (plan.total_count > max_count_) {
    utils::StructuredLog()
        .Event("plan_rejected")
        .Field("reason", "limit_exceeded")
        .Field("prefix", prefix)
        .Field("province", province)
        .Field("city", city)
        .Field("computed_count", plan.total_count)
        .Field("max_count", max_count_)
        .Warn();
    return MakeUnexpected(
        ResolveError{MakeError(ErrorCode::kPlanLimitExceeded, "Requested " + std::to_string(plan.total_count) +
                                                                  " numbers, limit is " + std::to_string(max_count_) +
                                                                  "; narrow the filters"),
                     plan.total_count});
  }

  utils::StructuredLog()
      .Event("plan_resolved")
      .Field("prefix", prefix)
      .Field("province", province)
      .Field("city", city)
      .Field("trailing", TrailingLabel(plan.trailing_rule))
      .Field("candidates", static_cast<uint64_t>(plan.candidates.size()))
      .Field("total_count", plan.total_count)
      .Debug();

  return plan;
}

}  // namespace phonegen::plan
