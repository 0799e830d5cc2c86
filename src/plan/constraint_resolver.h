/**
 * @file constraint_resolver.h
 * @brief Turns a FilterRequest into a validated EnumerationPlan
 */

#pragma once

#include <cstdint>
#include <string>

#include "index/lookup_index.h"
#include "plan/enumeration_plan.h"
#include "plan/filter_request.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace phonegen::plan {

/**
 * @brief Resolution failure
 *
 * error.code() is kPlanValidationError for a malformed request or
 * kPlanLimitExceeded when the plan is larger than the ceiling; in the
 * latter case computed_count holds the size the plan would have had.
 */
struct ResolveError {
  utils::Error error;
  uint64_t computed_count = 0;

  [[nodiscard]] std::string to_string() const { return error.to_string(); }
};

/**
 * @brief Request validation and plan construction
 *
 * Stateless apart from the shared read-only index and the configured
 * ceiling; safe to use from several threads at once.
 */
class ConstraintResolver {
 public:
  /**
   * @param index Lookup index (must outlive the resolver)
   * @param max_count Largest total_count a plan may have
   */
  ConstraintResolver(const index::LookupIndex& index, uint64_t max_count);

  /**
   * @brief Validate a request and build its plan
   *
   * The ceiling is checked here, before any enumeration work is done.
   * A region without coverage yields a valid plan with total_count 0.
   */
  [[nodiscard]] utils::Expected<EnumerationPlan, ResolveError> Validate(const FilterRequest& request) const;

  [[nodiscard]] uint64_t GetMaxCount() const { return max_count_; }

 private:
  const index::LookupIndex& index_;
  uint64_t max_count_;
};

}  // namespace phonegen::plan
