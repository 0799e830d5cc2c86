/**
 * @file partition_dispatcher.cpp
 * @brief Partition dispatcher implementation
 */

#include "generator/partition_dispatcher.h"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <new>
#include <optional>
#include <thread>

#include "generator/enumerator.h"
#include "utils/structured_log.h"

namespace phonegen::generator {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr size_t kFallbackWorkerCount = 4;

/**
 * @brief Completion latch shared by the partition tasks of one run
 */
class CompletionLatch {
 public:
  explicit CompletionLatch(size_t count) : remaining_(count) {}

  void CountDown() {
    std::scoped_lock lock(mutex_);
    if (remaining_ > 0 && --remaining_ == 0) {
      cv_.notify_all();
    }
  }

  void Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return remaining_ == 0; });
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  size_t remaining_;
};

}  // namespace

PartitionDispatcher::PartitionDispatcher(size_t max_threads)
    : PartitionDispatcher(max_threads, [](const plan::EnumerationPlan& plan, uint64_t start_offset,
                                          uint64_t end_offset, std::string& buffer) {
        return Enumerator::AppendRange(plan, start_offset, end_offset, buffer);
      }) {}

PartitionDispatcher::PartitionDispatcher(size_t max_threads, RangeGenerator generator)
    : pool_(std::make_unique<ThreadPool>(max_threads)), generator_(std::move(generator)) {}

PartitionDispatcher::~PartitionDispatcher() {
  pool_->Shutdown();
}

size_t PartitionDispatcher::EffectiveWorkerCount(size_t worker_count) {
  if (worker_count > 0) {
    return worker_count;
  }
  size_t hardware = std::thread::hardware_concurrency();
  return hardware > 0 ? hardware : kFallbackWorkerCount;
}

std::vector<PartitionRange> PartitionDispatcher::SplitRanges(uint64_t total, size_t worker_count) {
  worker_count = EffectiveWorkerCount(worker_count);

  const uint64_t base_size = total / worker_count;
  const uint64_t remainder = total % worker_count;

  std::vector<PartitionRange> ranges;
  ranges.reserve(worker_count);
  uint64_t offset = 0;
  for (size_t i = 0; i < worker_count; ++i) {
    uint64_t size = base_size + (i < remainder ? 1 : 0);
    PartitionRange range;
    range.ordinal = i;
    range.start_offset = offset;
    range.end_offset = offset + size;
    ranges.push_back(range);
    offset += size;
  }
  return ranges;
}

utils::Expected<std::vector<PartitionResult>, PartitionError> PartitionDispatcher::Run(
    const plan::EnumerationPlan& plan, size_t worker_count) const {
  const auto start_time = std::chrono::steady_clock::now();
  const std::vector<PartitionRange> ranges = SplitRanges(plan.total_count, worker_count);

  // Each task writes only its own slot, so no locking is needed on these
  std::vector<PartitionResult> results(ranges.size());
  std::vector<std::optional<utils::Error>> failures(ranges.size());

  CompletionLatch latch(ranges.size());

  for (const auto& range : ranges) {
    PartitionResult& result = results[range.ordinal];
    result.ordinal = range.ordinal;
    result.start_offset = range.start_offset;
    result.end_offset = range.end_offset;
    std::optional<utils::Error>& failure = failures[range.ordinal];

    auto task = [this, &plan, range, &result, &failure, &latch]() {
      try {
        auto generated = generator_(plan, range.start_offset, range.end_offset, result.lines);
        if (!generated) {
          failure = MakeError(ErrorCode::kPartitionFailed,
                              "Partition generation failed: " + generated.error().message(),
                              generated.error().context());
        } else {
          result.line_count = *generated;
        }
      } catch (const std::bad_alloc&) {
        failure = MakeError(ErrorCode::kPartitionFailed, "Out of memory while generating partition");
      } catch (const std::exception& e) {
        failure = MakeError(ErrorCode::kPartitionFailed, std::string("Partition generation threw: ") + e.what());
      }
      latch.CountDown();
    };

    if (!pool_->Submit(task)) {
      failure = MakeError(ErrorCode::kPartitionFailed, "Worker pool rejected the partition task");
      latch.CountDown();
    }
  }

  latch.Wait();

  for (size_t i = 0; i < failures.size(); ++i) {
    if (failures[i].has_value()) {
      utils::StructuredLog()
          .Event("dispatch_failed")
          .Field("partition", static_cast<uint64_t>(i))
          .Field("start_offset", ranges[i].start_offset)
          .Field("end_offset", ranges[i].end_offset)
          .Field("error", failures[i]->message())
          .Error();
      PartitionError error;
      error.error = *failures[i];
      error.partition_index = i;
      return MakeUnexpected(std::move(error));
    }
  }

  const auto elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time).count();
  utils::StructuredLog()
      .Event("dispatch_completed")
      .Field("partitions", static_cast<uint64_t>(ranges.size()))
      .Field("total_count", plan.total_count)
      .Field("elapsed_ms", static_cast<int64_t>(elapsed_ms))
      .Debug();

  return results;
}

}  // namespace phonegen::generator
