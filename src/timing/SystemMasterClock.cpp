// Repository: streamcore
// Component: Master Clock
// Purpose: System-backed MasterClock (system_clock for UTC, steady_clock
//          for monotonic time).
// Copyright (c) 2025 StreamCore

#include "streamcore/timing/MasterClock.h"

#include <atomic>
#include <chrono>
#include <memory>

namespace streamcore::timing {

namespace {

class SystemMasterClock : public MasterClock {
 public:
  explicit SystemMasterClock(double drift_ppm)
      : drift_ppm_(drift_ppm),
        monotonic_origin_(std::chrono::steady_clock::now()) {}

  int64_t now_utc_us() const override {
    const auto now = std::chrono::system_clock::now();
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch());
    return micros.count();
  }

  double now_monotonic_s() const override {
    const auto delta = std::chrono::steady_clock::now() - monotonic_origin_;
    return std::chrono::duration<double>(delta).count();
  }

  double drift_ppm() const override {
    return drift_ppm_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<double> drift_ppm_;
  std::chrono::steady_clock::time_point monotonic_origin_;
};

}  // namespace

std::shared_ptr<MasterClock> MakeSystemMasterClock(double drift_ppm) {
  return std::make_shared<SystemMasterClock>(drift_ppm);
}

}  // namespace streamcore::timing
