/**
 * @file partition_dispatcher.h
 * @brief Parallel generation of an enumeration plan over disjoint offset ranges
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "generator/thread_pool.h"
#include "plan/enumeration_plan.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace phonegen::generator {

/**
 * @brief Contiguous offset range [start_offset, end_offset)
 */
struct PartitionRange {
  size_t ordinal = 0;
  uint64_t start_offset = 0;
  uint64_t end_offset = 0;
};

/**
 * @brief Generated lines of one partition
 *
 * lines holds line_count newline-terminated numbers, in offset order.
 */
struct PartitionResult {
  size_t ordinal = 0;
  uint64_t start_offset = 0;
  uint64_t end_offset = 0;
  uint64_t line_count = 0;
  std::string lines;
};

/**
 * @brief Failure of one partition
 */
struct PartitionError {
  utils::Error error;
  size_t partition_index = 0;

  [[nodiscard]] std::string to_string() const {
    return "partition " + std::to_string(partition_index) + ": " + error.to_string();
  }
};

/**
 * @brief Splits a plan into ranges and generates them on a thread pool
 *
 * Run() blocks until every partition has finished; results are returned in
 * ordinal order regardless of completion order. A failure of any partition
 * fails the whole run, so no partial result is ever handed to the writer.
 */
class PartitionDispatcher {
 public:
  /**
   * @brief Per-partition generation function
   *
   * Appends the lines of [start_offset, end_offset) to buffer and returns
   * the number of lines appended. Defaults to Enumerator::AppendRange.
   */
  using RangeGenerator = std::function<utils::Expected<uint64_t, utils::Error>(
      const plan::EnumerationPlan& plan, uint64_t start_offset, uint64_t end_offset, std::string& buffer)>;

  /**
   * @param max_threads Pool size (0 = hardware concurrency)
   */
  explicit PartitionDispatcher(size_t max_threads = 0);

  PartitionDispatcher(size_t max_threads, RangeGenerator generator);

  ~PartitionDispatcher();

  PartitionDispatcher(const PartitionDispatcher&) = delete;
  PartitionDispatcher& operator=(const PartitionDispatcher&) = delete;
  PartitionDispatcher(PartitionDispatcher&&) = delete;
  PartitionDispatcher& operator=(PartitionDispatcher&&) = delete;

  /**
   * @brief Generate the full plan
   *
   * @param plan Plan to generate (must stay valid until Run returns)
   * @param worker_count Number of partitions (0 = hardware concurrency)
   * @return Results ordered by ordinal, or the failure of the lowest
   *         failing partition
   */
  [[nodiscard]] utils::Expected<std::vector<PartitionResult>, PartitionError> Run(const plan::EnumerationPlan& plan,
                                                                                  size_t worker_count) const;

  /**
   * @brief Split [0, total) into worker_count contiguous ranges
   *
   * Range sizes differ by at most one; the first (total % worker_count)
   * ranges get the extra offset. Ranges may be empty when total is smaller
   * than worker_count.
   */
  [[nodiscard]] static std::vector<PartitionRange> SplitRanges(uint64_t total, size_t worker_count);

  /**
   * @brief Resolve 0 to the hardware concurrency
   */
  [[nodiscard]] static size_t EffectiveWorkerCount(size_t worker_count);

  [[nodiscard]] size_t GetThreadCount() const { return pool_->GetThreadCount(); }

 private:
  std::unique_ptr<ThreadPool> pool_;
  RangeGenerator generator_;
};

}  // namespace phonegen::generator
