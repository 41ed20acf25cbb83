// Repository: streamcore
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from cycle scheduling in StreamCore.
//          Production: RealtimeWaitStrategy sleeps against the MasterClock.
//          Tests: a deterministic strategy advances a fake clock, no sleep.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_RUNTIME_IWAIT_STRATEGY_HPP_
#define STREAMCORE_RUNTIME_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

#include "streamcore/timing/MasterClock.h"

namespace streamcore::runtime {

class IWaitStrategy {
 public:
  virtual ~IWaitStrategy() = default;

  // Blocks until the session clock reaches deadline_ms.
  // Returns false if Cancel() interrupted the wait.
  virtual bool WaitUntilMs(int64_t deadline_ms) = 0;

  // Wakes any current wait and makes later waits return false until Reset().
  virtual void Cancel() = 0;
  virtual void Reset() = 0;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  explicit RealtimeWaitStrategy(std::shared_ptr<timing::MasterClock> clock)
      : clock_(std::move(clock)) {}

  bool WaitUntilMs(int64_t deadline_ms) override {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!cancelled_) {
      const int64_t remaining = deadline_ms - clock_->now_utc_ms();
      if (remaining <= 0) return true;
      cv_.wait_for(lock, std::chrono::milliseconds(remaining));
    }
    return false;
  }

  void Cancel() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  void Reset() override {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = false;
  }

 private:
  std::shared_ptr<timing::MasterClock> clock_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_ = false;
};

}  // namespace streamcore::runtime

#endif  // STREAMCORE_RUNTIME_IWAIT_STRATEGY_HPP_
