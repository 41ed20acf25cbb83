// Repository: streamcore
// Component: Master Clock
// Purpose: Time source behind every timestamp the core compares against.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_TIMING_MASTER_CLOCK_H_
#define STREAMCORE_TIMING_MASTER_CLOCK_H_

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace streamcore::timing {

// MasterClock provides wall-clock and monotonic time for the session.
// Pools stamp arrivals with it, the SyncCoordinator measures drift against
// it and the adaptation engine ages decisions and samples with it.
class MasterClock {
 public:
  virtual ~MasterClock() = default;

  // Returns current UTC time in microseconds since Unix epoch.
  virtual int64_t now_utc_us() const = 0;

  // Returns current monotonic time in seconds relative to clock start.
  virtual double now_monotonic_s() const = 0;

  // Reports measured drift in parts per million relative to upstream reference.
  virtual double drift_ppm() const = 0;

  // Nominal tick frequency of the underlying source.
  virtual int64_t frequency_hz() const { return 1'000; }

  // Returns true if this is a fake/test clock.
  // Fake clocks should not trigger real-time sleeps in consumers.
  virtual bool is_fake() const { return false; }

  int64_t now_utc_ms() const { return now_utc_us() / 1'000; }

  // Blocks until the clock reaches or exceeds target_utc_us.
  virtual void WaitUntilUtcUs(int64_t target_utc_us) const {
    while (true) {
      const int64_t now = now_utc_us();
      const int64_t remaining = target_utc_us - now;
      if (remaining <= 0) {
        break;
      }
      const int64_t sleep_us = (remaining > 2'000) ? remaining - 1'000
                                                    : std::max<int64_t>(remaining / 2, 200);
      std::this_thread::sleep_for(std::chrono::microseconds(sleep_us));
    }
  }
};

std::shared_ptr<MasterClock> MakeSystemMasterClock(double drift_ppm = 0.0);

}  // namespace streamcore::timing

#endif  // STREAMCORE_TIMING_MASTER_CLOCK_H_
