/**
 * @file thread_pool.cpp
 * @brief Thread pool implementation
 */

#include "generator/thread_pool.h"

#include <exception>

#include "utils/structured_log.h"

namespace phonegen::generator {

namespace {
constexpr size_t kFallbackThreadCount = 4;
}  // namespace

ThreadPool::ThreadPool(size_t num_threads) {
  if (num_threads == 0) {
    num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0) {
      num_threads = kFallbackThreadCount;
    }
  }

  utils::StructuredLog().Event("thread_pool_created").Field("workers", static_cast<uint64_t>(num_threads)).Debug();

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back(&ThreadPool::WorkerThread, this);
  }
}

ThreadPool::~ThreadPool() {
  Shutdown();
}

bool ThreadPool::Submit(Task task) {
  {
    std::scoped_lock lock(queue_mutex_);
    if (shutdown_) {
      return false;
    }
    tasks_.push(std::move(task));
  }
  condition_.notify_one();
  return true;
}

void ThreadPool::Shutdown() {
  {
    std::scoped_lock lock(queue_mutex_);
    if (shutdown_) {
      return;
    }
    shutdown_ = true;
  }

  condition_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  utils::StructuredLog().Event("thread_pool_shutdown").Debug();
}

void ThreadPool::WorkerThread() {
  while (true) {
    Task task;

    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      condition_.wait(lock, [this] { return shutdown_ || !tasks_.empty(); });

      // Queued tasks are drained before the worker exits
      if (shutdown_ && tasks_.empty()) {
        return;
      }

      task = std::move(tasks_.front());
      tasks_.pop();
    }

    if (task) {
      try {
        task();
      } catch (const std::exception& e) {
        utils::StructuredLog().Event("thread_pool_error").Field("type", "task_exception").Field("error", e.what()).Error();
      }
    }
  }
}

}  // namespace phonegen::generator
