// Repository: streamcore
// Component: Stream Core
// Purpose: In-process facade wiring buffer pools, the sync coordinator, the
//          codec registry and the adaptation engine behind the inbound
//          operations, with outbound events on per-consumer channels.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_RUNTIME_STREAM_CORE_HPP_
#define STREAMCORE_RUNTIME_STREAM_CORE_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "streamcore/adaptation/QualityAdaptationEngine.hpp"
#include "streamcore/buffer/BufferPoolManager.hpp"
#include "streamcore/codec/CodecRegistry.hpp"
#include "streamcore/runtime/CoreConfig.hpp"
#include "streamcore/runtime/EventChannel.hpp"
#include "streamcore/runtime/IWaitStrategy.hpp"
#include "streamcore/timing/MasterClock.h"
#include "streamcore/timing/SyncCoordinator.hpp"

namespace streamcore::runtime {

enum class StreamStartResult {
  kStarted,
  kAlreadyExists,
  kNoCodec,      // no registered codec fits the stream
  kEmptyLadder,  // the codec cannot produce a ladder under the bitrate bound
  kNoValidRung,  // no ladder rung satisfies the constraints
};

const char* StreamStartResultToString(StreamStartResult result);

// Optional per-stream knobs beyond kind, preferences and constraints.
struct StreamOptions {
  std::string codec;            // empty = CodecRegistry::Select for the kind
  int64_t max_bitrate_bps = 0;  // 0 = constraints max, else codec max
  std::optional<buffer::CapacityStrategy> strategy;  // unset = config default
  int64_t target_latency_ms = 0;
};

struct UnderrunEvent {
  std::string stream_id;
  int64_t at_ms = 0;
  size_t level = 0;  // chunks buffered when raised
  size_t low_watermark = 0;
};

struct EvictionEvent {
  std::string stream_id;
  int64_t at_ms = 0;
  size_t dropped_count = 0;
  // Chunks that could not go because a SyncPoint pins them.
  size_t blocked_by_pins = 0;
};

struct CycleReport {
  timing::ReconcileReport reconcile;
  // Non-maintain decisions applied and published this cycle.
  std::vector<adaptation::AdaptationDecision> decisions;
  bool full_evaluation = false;
};

// StreamCore is the single entry point for the transport/session layer.
//
// Threading: every inbound call may come from any thread. Per-stream state
// is serialized inside the pool and adaptation components; the SyncPoint
// table is serialized by the SyncCoordinator. StreamCore's own mutex only
// guards its stream table and scheduling state.
//
// Events are delivered at-least-once: they stay on their channel until the
// consumer polls or drains them.
class StreamCore {
 public:
  // Throws std::invalid_argument if clock is null or config fails Validate().
  // A null wait strategy selects RealtimeWaitStrategy on the clock.
  StreamCore(std::shared_ptr<timing::MasterClock> clock, CoreConfig config,
             std::unique_ptr<IWaitStrategy> wait = nullptr,
             std::unique_ptr<adaptation::IQualityScorer> scorer = nullptr);

  ~StreamCore();

  StreamCore(const StreamCore&) = delete;
  StreamCore& operator=(const StreamCore&) = delete;

  // Inbound.
  StreamStartResult StartStream(const std::string& stream_id, MediaKind kind,
                                const adaptation::UserPreferences& preferences,
                                const adaptation::QualityConstraints& constraints,
                                const StreamOptions& options = StreamOptions{});
  bool EndStream(const std::string& stream_id);

  buffer::AdmissionOutcome SubmitChunk(const std::string& stream_id, buffer::Chunk chunk);
  buffer::NextChunkResult NextChunk(const std::string& stream_id, int64_t current_time_ms);

  bool ReportNetworkConditions(const std::string& stream_id,
                               const NetworkConditions& conditions);
  bool ReportDeviceCapabilities(const std::string& stream_id,
                                const adaptation::DeviceCapabilities& capabilities);

  // Override path for an external coordinator. An applied change is
  // published on the decision channel like any other decision.
  adaptation::ForceOutcome ForceQualityChange(const std::string& stream_id,
                                              const std::string& target_quality,
                                              const std::string& reason);

  // Pins point.chunk_ref in the declaring stream's pool until the SyncPoint
  // completes or expires. Returns 0 if the coordinator refused the point.
  uint64_t AddSyncPoint(const timing::SyncPoint& point);
  timing::SyncVerdict ReportSyncArrival(uint64_t sync_point_id, const std::string& stream_id,
                                        int64_t playout_ms);

  // Records a stream's playout position for drift estimation and for
  // Synchronize.
  bool ReportPlayoutTime(const std::string& stream_id, int64_t playout_ms);

  // Aligns the streams to reference_time_ms. A stream pushed beyond the
  // correction window is published on the desync channel and flagged for an
  // emergency adaptation, as with ReportSyncArrival.
  std::vector<timing::SyncVerdict> Synchronize(const std::vector<std::string>& stream_ids,
                                               int64_t reference_time_ms,
                                               int64_t tolerance_ms = 0);

  // One scheduler tick: reconciliation, then evaluation of every stream when
  // the evaluation interval has elapsed, otherwise only of streams with
  // pending emergencies.
  CycleReport RunCycle(int64_t now_ms);

  // Runs RunCycle every reconcile_interval_ms on a worker thread.
  void Start();
  void Stop();
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Outbound channels.
  EventChannel<adaptation::AdaptationDecision>& decisions() { return decisions_; }
  EventChannel<UnderrunEvent>& underruns() { return underruns_; }
  EventChannel<timing::DesyncEvent>& desyncs() { return desyncs_; }
  EventChannel<EvictionEvent>& evictions() { return evictions_; }
  const EventChannel<adaptation::AdaptationDecision>& decisions() const { return decisions_; }
  const EventChannel<UnderrunEvent>& underruns() const { return underruns_; }
  const EventChannel<timing::DesyncEvent>& desyncs() const { return desyncs_; }
  const EventChannel<EvictionEvent>& evictions() const { return evictions_; }

  // Components, for statistics and tests.
  const buffer::BufferPoolManager& pools() const { return pools_; }
  const timing::SyncCoordinator& coordinator() const { return coordinator_; }
  const adaptation::QualityAdaptationEngine& engine() const { return engine_; }
  codec::CodecRegistry& registry() { return registry_; }
  const codec::CodecRegistry& registry() const { return registry_; }

  std::vector<std::string> StreamIds() const;
  const CoreConfig& config() const { return config_; }

 private:
  struct StreamEntry {
    MediaKind kind = MediaKind::kData;
    std::string codec;
    int64_t last_bandwidth_bps = 0;
    int64_t started_at_ms = 0;
  };

  std::optional<StreamEntry> Entry(const std::string& stream_id) const;
  void MarkUrgent(const std::string& stream_id);
  void ApplyDecision(const adaptation::AdaptationDecision& decision);
  void RefreshSessionMetrics(const std::string& stream_id, int64_t now_ms);
  void ReleaseSyncPoint(const timing::SyncPoint& point);
  void PublishRaisedDesyncs();
  template <typename T>
  void Publish(EventChannel<T>& channel, T event, const char* name);
  void WorkerLoop();

  std::shared_ptr<timing::MasterClock> clock_;
  const CoreConfig config_;
  std::unique_ptr<IWaitStrategy> wait_;

  codec::CodecRegistry registry_;
  buffer::BufferPoolManager pools_;
  timing::SyncCoordinator coordinator_;
  adaptation::QualityAdaptationEngine engine_;

  EventChannel<adaptation::AdaptationDecision> decisions_;
  EventChannel<UnderrunEvent> underruns_;
  EventChannel<timing::DesyncEvent> desyncs_;
  EventChannel<EvictionEvent> evictions_;

  mutable std::mutex mutex_;
  std::map<std::string, StreamEntry> streams_;
  std::set<std::string> urgent_;
  int64_t next_evaluation_ms_ = -1;

  // Start/Stop are serialized by lifecycle_mutex_.
  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::thread worker_;
};

}  // namespace streamcore::runtime

#endif  // STREAMCORE_RUNTIME_STREAM_CORE_HPP_
