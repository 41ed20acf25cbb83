// Repository: streamcore
// Component: Sync Types
// Purpose: Clock references, SyncPoints and verdicts exchanged with the
//          SyncCoordinator.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_TIMING_SYNC_TYPES_HPP_
#define STREAMCORE_TIMING_SYNC_TYPES_HPP_

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace streamcore::timing {

enum class ClockKind {
  kLocal = 0,
  kNetwork = 1,
  kMaster = 2,
};

const char* ClockKindToString(ClockKind kind);

// Session state machine:
//   uninitialized → synchronizing → synchronized ⇄ desynced → terminated
enum class SyncState {
  kUninitialized = 0,
  kSynchronizing = 1,
  kSynchronized = 2,
  kDesynced = 3,
  kTerminated = 4,
};

const char* SyncStateToString(SyncState state);

// Candidate time source offered to InitMasterClock.
struct ClockSource {
  std::string id;
  ClockKind kind = ClockKind::kLocal;  // kLocal or kNetwork
  int64_t frequency_hz = 1'000;
  double accuracy_ms = 1.0;  // smaller is better
  double offset_ms = 0.0;
};

struct ClockReference {
  std::string id;
  ClockKind kind = ClockKind::kLocal;
  // For the master: which kind of source backs it.
  ClockKind source = ClockKind::kLocal;
  int64_t frequency_hz = 1'000;
  double drift_ppm = 0.0;
  // Stream references: offset relative to the master. The master itself:
  // estimated offset of its source from the local MasterClock.
  double offset_ms = 0.0;
  double accuracy_ms = 1.0;
  int64_t last_sync_ms = 0;

  // Effective playout rate (1.0 = nominal) while a correction is in flight.
  double rate = 1.0;
  double pending_correction_ms = 0.0;
};

struct SyncPoint {
  uint64_t id = 0;  // assigned by AddSyncPoint
  int64_t timestamp_ms = 0;
  std::string stream_id;  // declaring stream
  uint64_t chunk_ref = 0;  // sequence pinned in the declaring stream's pool
  int priority = 0;
  int64_t tolerance_ms = 0;  // 0 = use configured sync_tolerance_ms
  std::set<std::string> dependencies;  // streams that must arrive
  int64_t expires_at_ms = 0;  // 0 = now + sync_point_ttl_ms
};

enum class SyncAction {
  kNone = 0,        // within tolerance
  kRateAdjust = 1,  // gradual rate correction scheduled
  kDesync = 2,      // beyond the correction window
  kRejected = 3,    // unknown stream / SyncPoint or terminated session
};

const char* SyncActionToString(SyncAction action);

struct SyncVerdict {
  std::string stream_id;
  SyncAction action = SyncAction::kRejected;
  double adjustment_ms = 0.0;
  double rate = 1.0;
  uint64_t sync_point_id = 0;
};

// DesyncEvent reasons.
inline constexpr const char* kDesyncWindowExceeded = "correction_window_exceeded";
inline constexpr const char* kDesyncSyncPointExpired = "sync_point_expired";

struct DesyncEvent {
  std::string stream_id;
  SyncPoint sync_point;
  std::string reason;
};

struct ReconcileReport {
  std::vector<SyncPoint> completed;
  std::vector<DesyncEvent> desyncs;
  std::vector<SyncVerdict> corrections;
  // Streams for which an emergency adaptation must be requested.
  std::vector<std::string> emergency_streams;
  SyncState state = SyncState::kUninitialized;
};

struct SyncStatistics {
  SyncState state = SyncState::kUninitialized;
  size_t stream_clocks = 0;
  size_t pending_sync_points = 0;
  size_t desynced_streams = 0;
  uint64_t completed_sync_points = 0;
  uint64_t expired_sync_points = 0;
  uint64_t corrections = 0;
  uint64_t desync_events = 0;
  uint64_t eviction_conflicts = 0;
  double master_accuracy_ms = 0.0;
  double master_offset_ms = 0.0;
};

}  // namespace streamcore::timing

#endif  // STREAMCORE_TIMING_SYNC_TYPES_HPP_
