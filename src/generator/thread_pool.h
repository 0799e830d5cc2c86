/**
 * @file thread_pool.h
 * @brief Fixed-size worker thread pool
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace phonegen::generator {

/**
 * @brief Fixed set of workers draining an unbounded task queue
 */
class ThreadPool {
 public:
  using Task = std::function<void()>;

  /**
   * @param num_threads Worker count (0 = hardware concurrency)
   */
  explicit ThreadPool(size_t num_threads = 0);

  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  /**
   * @brief Queue a task
   * @return false if the pool is shutting down
   */
  [[nodiscard]] bool Submit(Task task);

  [[nodiscard]] size_t GetThreadCount() const { return workers_.size(); }

  /**
   * @brief Run every queued task, then join all workers
   */
  void Shutdown();

 private:
  std::vector<std::thread> workers_;
  std::queue<Task> tasks_;
  std::mutex queue_mutex_;
  std::condition_variable condition_;
  bool shutdown_ = false;

  void WorkerThread();
};

}  // namespace phonegen::generator
