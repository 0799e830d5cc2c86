/**
 * @file scope_guard.h
 * @brief Run a callable when the enclosing scope exits
 */

#pragma once

#include <utility>

namespace phonegen::utils {

template <typename F>
class ScopeGuard {
 public:
  explicit ScopeGuard(F func) : func_(std::move(func)) {}

  ~ScopeGuard() {
    if (active_) {
      func_();
    }
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard(ScopeGuard&&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  /**
   * @brief Cancel the pending action
   */
  void Dismiss() { active_ = false; }

 private:
  F func_;
  bool active_ = true;
};

}  // namespace phonegen::utils
