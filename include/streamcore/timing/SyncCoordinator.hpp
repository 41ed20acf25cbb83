// Repository: streamcore
// Component: Sync Coordinator
// Purpose: Owns the session's master clock reference, per-stream clock
//          references and the SyncPoint table; computes bounded drift
//          corrections and reports desyncs.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_TIMING_SYNC_COORDINATOR_HPP_
#define STREAMCORE_TIMING_SYNC_COORDINATOR_HPP_

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "streamcore/timing/MasterClock.h"
#include "streamcore/timing/SyncTypes.hpp"

namespace streamcore::timing {

struct SyncConfig {
  int64_t sync_tolerance_ms = 20;

  // Adjustments up to this magnitude are corrected by rate; beyond it the
  // stream is declared desynced.
  int64_t correction_window_ms = 1'000;

  // Max change of playout rate per reconciliation cycle (0.05 = 5%).
  double correction_rate_limit = 0.05;

  // Max absolute deviation of playout rate from 1.0.
  double max_rate_deviation = 0.10;

  int64_t reconcile_interval_ms = 250;
  int64_t sync_point_ttl_ms = 2'000;

  // EWMA gain applied to network offset samples.
  double network_offset_gain = 0.125;
};

// SyncCoordinator is the single coordination boundary for cross-stream
// timing state. Every method takes mutex_; there is no other path to the
// master reference or the SyncPoint table.
//
// Corrections never jump: an adjustment is recorded as pending and absorbed
// by a playout rate that moves at most correction_rate_limit per cycle.
class SyncCoordinator {
 public:
  // Throws std::invalid_argument if clock is null or the config is
  // inconsistent (non-positive interval, window smaller than tolerance).
  SyncCoordinator(std::shared_ptr<MasterClock> clock, SyncConfig config);

  SyncCoordinator(const SyncCoordinator&) = delete;
  SyncCoordinator& operator=(const SyncCoordinator&) = delete;

  // Establishes the master reference from the most accurate candidate,
  // preferring network sources on ties. With no candidates the local
  // MasterClock backs it. Replaces any previous master.
  ClockReference InitMasterClock(const std::vector<ClockSource>& sources = {});

  // Creates a local reference with zero offset. False if the session is
  // uninitialized/terminated or the stream is already registered.
  bool RegisterStreamClock(const std::string& stream_id);
  bool UnregisterStreamClock(const std::string& stream_id);

  // Records the stream's current playout position and refines its drift
  // estimate against the master.
  bool ReportPlayoutTime(const std::string& stream_id, int64_t playout_ms);

  // NTP-style sample for a network master: smooths offset, accuracy = rtt/2.
  void UpdateNetworkEstimate(double offset_ms, int64_t rtt_ms);

  // Registers a SyncPoint. Returns its id, or 0 if the session is not
  // initialized or the point has no dependencies.
  uint64_t AddSyncPoint(SyncPoint point);

  // A dependent stream reached the SyncPoint at playout_ms. Within tolerance
  // the arrival is recorded; otherwise a correction (or desync) is issued
  // for that stream and the arrival stays outstanding.
  SyncVerdict ReportArrival(uint64_t sync_point_id, const std::string& stream_id,
                            int64_t playout_ms);

  // adjustment = reference_time - (stream_playout_time + offset) for each
  // stream; tolerance_ms <= 0 uses the configured tolerance.
  std::vector<SyncVerdict> Synchronize(const std::vector<std::string>& stream_ids,
                                       int64_t reference_time_ms,
                                       int64_t tolerance_ms = 0);

  // One reconciliation cycle: steps in-flight rate corrections, drains
  // completed SyncPoints, expires overdue ones as desyncs and reports every
  // desync raised by an arrival or Synchronize since the previous cycle.
  ReconcileReport Reconcile(int64_t now_ms);

  // Hands over the desyncs raised since the last Reconcile or TakeDesyncs,
  // so a caller can publish them immediately. Taken events are not
  // reported again by Reconcile.
  std::vector<DesyncEvent> TakeDesyncs();

  // A pool could not evict chunks pinned by SyncPoints. Returns the ids of
  // the SyncPoints involved.
  std::vector<uint64_t> NotifyEvictionBlocked(const std::string& stream_id,
                                              const std::vector<uint64_t>& sequences);

  void Terminate();

  SyncState state() const;
  std::optional<ClockReference> master() const;
  std::optional<ClockReference> clock(const std::string& stream_id) const;
  std::vector<SyncPoint> PendingSyncPoints() const;
  bool IsStreamDesynced(const std::string& stream_id) const;
  SyncStatistics Statistics() const;

  const SyncConfig& config() const { return config_; }

 private:
  struct StreamClock {
    ClockReference reference;
    // Rate when the current reconciliation cycle began; every update within
    // the cycle is clamped against it.
    double cycle_start_rate = 1.0;
    bool has_playout = false;
    int64_t last_playout_ms = 0;
    int64_t last_master_ms = 0;
    bool desynced = false;
  };

  struct PendingPoint {
    SyncPoint point;
    std::set<std::string> arrived;
  };

  SyncVerdict EvaluateLocked(StreamClock& stream, const std::string& stream_id,
                             double adjustment_ms, int64_t tolerance_ms,
                             uint64_t sync_point_id);
  double ClampRateLocked(double cycle_start_rate, double desired_rate) const;
  void StepCorrectionLocked(StreamClock& stream, int64_t elapsed_ms,
                            int64_t tolerance_ms);
  void RefreshStateLocked();
  int64_t ToleranceFor(int64_t tolerance_ms) const;

  std::shared_ptr<MasterClock> clock_;
  const SyncConfig config_;

  mutable std::mutex mutex_;
  SyncState state_ = SyncState::kUninitialized;
  std::optional<ClockReference> master_;
  std::map<std::string, StreamClock> streams_;
  std::map<uint64_t, PendingPoint> sync_points_;
  std::vector<DesyncEvent> raised_desyncs_;
  uint64_t next_sync_point_id_ = 1;
  int64_t last_reconcile_ms_ = -1;

  uint64_t completed_total_ = 0;
  uint64_t expired_total_ = 0;
  uint64_t corrections_total_ = 0;
  uint64_t desync_total_ = 0;
  uint64_t eviction_conflicts_ = 0;
};

}  // namespace streamcore::timing

#endif  // STREAMCORE_TIMING_SYNC_COORDINATOR_HPP_
