// Repository: streamcore
// Component: Stream Core
// Purpose: Routes inbound traffic to the core components, runs the
//          reconcile/evaluate cycle and publishes outbound events.
// Copyright (c) 2025 StreamCore

#include "streamcore/runtime/StreamCore.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "streamcore/util/Logger.hpp"

namespace streamcore::runtime {

namespace {

// Ladder ceiling when neither the caller nor the constraints bound it.
constexpr int64_t kDefaultVideoCeilingBps = 8'000'000;
constexpr int64_t kDefaultAudioCeilingBps = 256'000;

std::shared_ptr<timing::MasterClock> RequireClock(std::shared_ptr<timing::MasterClock> clock) {
  if (!clock) {
    throw std::invalid_argument("StreamCore requires a MasterClock");
  }
  return clock;
}

CoreConfig Validated(CoreConfig config) {
  config.Validate();
  return config;
}

}  // namespace

const char* StreamStartResultToString(StreamStartResult result) {
  switch (result) {
    case StreamStartResult::kStarted:       return "started";
    case StreamStartResult::kAlreadyExists: return "already_exists";
    case StreamStartResult::kNoCodec:       return "no_codec";
    case StreamStartResult::kEmptyLadder:   return "empty_ladder";
    case StreamStartResult::kNoValidRung:   return "no_valid_rung";
  }
  return "unknown";
}

StreamCore::StreamCore(std::shared_ptr<timing::MasterClock> clock, CoreConfig config,
                       std::unique_ptr<IWaitStrategy> wait,
                       std::unique_ptr<adaptation::IQualityScorer> scorer)
    : clock_(RequireClock(std::move(clock))),
      config_(Validated(std::move(config))),
      wait_(std::move(wait)),
      registry_(config_.codec),
      pools_(clock_, config_.buffer),
      coordinator_(clock_, config_.sync),
      engine_(clock_, config_.adaptation, std::move(scorer)),
      decisions_(config_.channels.capacity, OverflowPolicy::kRetainAll),
      underruns_(config_.channels.capacity),
      desyncs_(config_.channels.capacity),
      evictions_(config_.channels.capacity) {
  if (!wait_) {
    wait_ = std::make_unique<RealtimeWaitStrategy>(clock_);
  }
  coordinator_.InitMasterClock();
}

StreamCore::~StreamCore() { Stop(); }

// ---------------------------------------------------------------------------
// Stream lifecycle
// ---------------------------------------------------------------------------

StreamStartResult StreamCore::StartStream(const std::string& stream_id, MediaKind kind,
                                          const adaptation::UserPreferences& preferences,
                                          const adaptation::QualityConstraints& constraints,
                                          const StreamOptions& options) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (streams_.count(stream_id) != 0) return StreamStartResult::kAlreadyExists;
  }

  StreamEntry entry;
  entry.kind = kind;
  entry.started_at_ms = clock_->now_utc_ms();

  // Data streams are buffered and synchronized but carry no quality ladder.
  codec::QualityLadder ladder;
  if (kind != MediaKind::kData) {
    std::optional<codec::CodecProfile> profile;
    if (!options.codec.empty()) {
      profile = registry_.Find(options.codec);
      if (profile && profile->kind != kind) profile.reset();
    } else {
      codec::CodecConstraints wanted;
      if (kind == MediaKind::kVideo && constraints.min_resolution.width > 0) {
        wanted.resolution = constraints.min_resolution;
      }
      wanted.framerate = constraints.min_framerate;
      wanted.low_latency = constraints.latency_budget_ms > 0 &&
                           constraints.latency_budget_ms <= config_.buffer.low_latency_ms;
      profile = registry_.Select(kind, wanted);
    }
    if (!profile) {
      util::Logger::Warn("[StreamCore] START_REJECTED stream=" + stream_id + " reason=no_codec");
      return StreamStartResult::kNoCodec;
    }
    entry.codec = profile->name;

    int64_t ceiling = options.max_bitrate_bps;
    if (ceiling <= 0) ceiling = constraints.max_bitrate_bps;
    if (ceiling <= 0) {
      ceiling = kind == MediaKind::kVideo ? kDefaultVideoCeilingBps : kDefaultAudioCeilingBps;
    }
    ladder = registry_.BuildLadder(profile->name, ceiling);
    if (ladder.empty()) {
      util::Logger::Warn("[StreamCore] START_REJECTED stream=" + stream_id +
                         " reason=empty_ladder codec=" + profile->name);
      return StreamStartResult::kEmptyLadder;
    }
  }

  const buffer::CapacityStrategy strategy =
      options.strategy ? *options.strategy : config_.buffer.capacity_strategy;
  if (!pools_.CreatePool(stream_id, kind, strategy, options.target_latency_ms)) {
    return StreamStartResult::kAlreadyExists;
  }
  coordinator_.RegisterStreamClock(stream_id);

  if (!ladder.empty()) {
    const adaptation::StartStreamResult added =
        engine_.AddStream(stream_id, kind, std::move(ladder), preferences, constraints);
    if (added != adaptation::StartStreamResult::kStarted) {
      pools_.DestroyPool(stream_id);
      coordinator_.UnregisterStreamClock(stream_id);
      return added == adaptation::StartStreamResult::kAlreadyExists
                 ? StreamStartResult::kAlreadyExists
                 : StreamStartResult::kNoValidRung;
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    streams_[stream_id] = entry;
  }

  std::ostringstream oss;
  oss << "[StreamCore] STREAM_START stream=" << stream_id
      << " kind=" << MediaKindToString(kind)
      << " codec=" << (entry.codec.empty() ? "-" : entry.codec)
      << " strategy=" << buffer::CapacityStrategyToString(strategy);
  util::Logger::Info(oss.str());
  return StreamStartResult::kStarted;
}

bool StreamCore::EndStream(const std::string& stream_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (streams_.erase(stream_id) == 0) return false;
    urgent_.erase(stream_id);
  }
  engine_.RemoveStream(stream_id);
  pools_.DestroyPool(stream_id);
  coordinator_.UnregisterStreamClock(stream_id);
  util::Logger::Info("[StreamCore] STREAM_END stream=" + stream_id);
  return true;
}

std::optional<StreamCore::StreamEntry> StreamCore::Entry(const std::string& stream_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(stream_id);
  if (it == streams_.end()) return std::nullopt;
  return it->second;
}

std::vector<std::string> StreamCore::StreamIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(streams_.size());
  for (const auto& [id, entry] : streams_) ids.push_back(id);
  return ids;
}

void StreamCore::MarkUrgent(const std::string& stream_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (streams_.count(stream_id) != 0) urgent_.insert(stream_id);
}

template <typename T>
void StreamCore::Publish(EventChannel<T>& channel, T event, const char* name) {
  if (!channel.Push(std::move(event))) {
    util::Logger::Warn(std::string("[StreamCore] CHANNEL_OVERFLOW channel=") + name +
                       " overflow_total=" + std::to_string(channel.overflow_total()));
  }
}

// ---------------------------------------------------------------------------
// Chunk traffic
// ---------------------------------------------------------------------------

buffer::AdmissionOutcome StreamCore::SubmitChunk(const std::string& stream_id,
                                                 buffer::Chunk chunk) {
  if (chunk.stream_id.empty()) chunk.stream_id = stream_id;
  buffer::AdmissionOutcome outcome = pools_.AddChunk(stream_id, std::move(chunk));

  if (outcome.evicted > 0 || !outcome.blocked_by_pins.empty()) {
    EvictionEvent event;
    event.stream_id = stream_id;
    event.at_ms = clock_->now_utc_ms();
    event.dropped_count = outcome.evicted;
    event.blocked_by_pins = outcome.blocked_by_pins.size();
    Publish(evictions_, std::move(event), "evictions");
  }

  if (!outcome.blocked_by_pins.empty()) {
    // Sync data wins over admission: degrade the stream instead.
    const std::vector<uint64_t> points =
        coordinator_.NotifyEvictionBlocked(stream_id, outcome.blocked_by_pins);
    engine_.SignalEmergency(stream_id, "eviction-blocked");
    MarkUrgent(stream_id);
    util::Logger::Warn("[StreamCore] EVICTION_BLOCKED stream=" + stream_id +
                       " pinned=" + std::to_string(outcome.blocked_by_pins.size()) +
                       " sync_points=" + std::to_string(points.size()));
  }
  return outcome;
}

buffer::NextChunkResult StreamCore::NextChunk(const std::string& stream_id,
                                              int64_t current_time_ms) {
  buffer::NextChunkResult result = pools_.NextChunk(stream_id, current_time_ms);

  if (result.status == buffer::NextChunkStatus::kDelivered && result.chunk) {
    coordinator_.ReportPlayoutTime(stream_id, result.chunk->timestamp_ms);
  }

  if (result.underrun_raised) {
    UnderrunEvent event;
    event.stream_id = stream_id;
    event.at_ms = current_time_ms;
    if (auto pool = pools_.GetPool(stream_id)) {
      event.level = pool->Size();
      event.low_watermark = pool->GetWatermarks().low;
    }
    Publish(underruns_, std::move(event), "underruns");
    if (engine_.SignalUnderrun(stream_id)) MarkUrgent(stream_id);
  }
  return result;
}

// ---------------------------------------------------------------------------
// Context samples
// ---------------------------------------------------------------------------

bool StreamCore::ReportNetworkConditions(const std::string& stream_id,
                                         const NetworkConditions& conditions) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) return false;
    it->second.last_bandwidth_bps = conditions.bandwidth_bps;
  }
  engine_.UpdateNetworkConditions(stream_id, conditions);
  const buffer::PoolAdaptation adapted = pools_.AdaptToConditions(stream_id, conditions);
  if (adapted.evicted > 0) {
    EvictionEvent event;
    event.stream_id = stream_id;
    event.at_ms = clock_->now_utc_ms();
    event.dropped_count = adapted.evicted;
    Publish(evictions_, std::move(event), "evictions");
  }
  return true;
}

bool StreamCore::ReportDeviceCapabilities(const std::string& stream_id,
                                          const adaptation::DeviceCapabilities& capabilities) {
  if (!Entry(stream_id)) return false;
  engine_.UpdateDeviceCapabilities(stream_id, capabilities);
  return true;
}

adaptation::ForceOutcome StreamCore::ForceQualityChange(const std::string& stream_id,
                                                        const std::string& target_quality,
                                                        const std::string& reason) {
  adaptation::ForceOutcome outcome =
      engine_.ForceQualityChange(stream_id, target_quality, reason);
  if (outcome.result == adaptation::ForceResult::kApplied && outcome.decision) {
    ApplyDecision(*outcome.decision);
    Publish(decisions_, *outcome.decision, "decisions");
  }
  return outcome;
}

// ---------------------------------------------------------------------------
// Synchronization
// ---------------------------------------------------------------------------

uint64_t StreamCore::AddSyncPoint(const timing::SyncPoint& point) {
  const bool pinned = !point.stream_id.empty() && pools_.PinChunk(point.stream_id, point.chunk_ref);
  const uint64_t id = coordinator_.AddSyncPoint(point);
  if (id == 0 && pinned) {
    pools_.UnpinChunk(point.stream_id, point.chunk_ref);
  }
  return id;
}

timing::SyncVerdict StreamCore::ReportSyncArrival(uint64_t sync_point_id,
                                                  const std::string& stream_id,
                                                  int64_t playout_ms) {
  timing::SyncVerdict verdict = coordinator_.ReportArrival(sync_point_id, stream_id, playout_ms);
  if (verdict.action == timing::SyncAction::kDesync) PublishRaisedDesyncs();
  return verdict;
}

std::vector<timing::SyncVerdict> StreamCore::Synchronize(const std::vector<std::string>& stream_ids,
                                                         int64_t reference_time_ms,
                                                         int64_t tolerance_ms) {
  std::vector<timing::SyncVerdict> verdicts =
      coordinator_.Synchronize(stream_ids, reference_time_ms, tolerance_ms);
  for (const auto& verdict : verdicts) {
    if (verdict.action == timing::SyncAction::kDesync) {
      PublishRaisedDesyncs();
      break;
    }
  }
  return verdicts;
}

bool StreamCore::ReportPlayoutTime(const std::string& stream_id, int64_t playout_ms) {
  return coordinator_.ReportPlayoutTime(stream_id, playout_ms);
}

void StreamCore::PublishRaisedDesyncs() {
  for (auto& event : coordinator_.TakeDesyncs()) {
    const std::string stream_id = event.stream_id;
    Publish(desyncs_, std::move(event), "desyncs");
    if (engine_.SignalDesync(stream_id)) MarkUrgent(stream_id);
  }
}

void StreamCore::ReleaseSyncPoint(const timing::SyncPoint& point) {
  if (!point.stream_id.empty()) {
    pools_.UnpinChunk(point.stream_id, point.chunk_ref);
  }
}

// ---------------------------------------------------------------------------
// Cycle
// ---------------------------------------------------------------------------

void StreamCore::RefreshSessionMetrics(const std::string& stream_id, int64_t now_ms) {
  auto pool = pools_.GetPool(stream_id);
  if (!pool) return;
  const buffer::PoolSnapshot snap = pool->Snapshot();
  const std::optional<StreamEntry> entry = Entry(stream_id);

  adaptation::SessionMetrics metrics;
  metrics.duration_ms = entry ? now_ms - entry->started_at_ms : 0;
  // Healthy at or above the target level of half the capacity.
  metrics.buffer_health = std::clamp(snap.metrics.level / 0.5, 0.0, 1.0);
  metrics.rebuffering_events = snap.metrics.underrun_count;
  metrics.average_latency_ms = static_cast<int64_t>(snap.metrics.latency_avg_ms);
  if (snap.metrics.chunks_admitted > 0) {
    metrics.error_rate = static_cast<double>(snap.metrics.chunks_rejected) /
                         static_cast<double>(snap.metrics.chunks_admitted +
                                             snap.metrics.chunks_rejected);
  }
  metrics.total_bytes = static_cast<uint64_t>(snap.metrics.throughput_bps / 8.0 *
                                              static_cast<double>(metrics.duration_ms) / 1000.0);
  engine_.UpdateSessionMetrics(stream_id, metrics);
}

void StreamCore::ApplyDecision(const adaptation::AdaptationDecision& decision) {
  if (decision.action == adaptation::AdaptationAction::kMaintain) return;
  const std::optional<StreamEntry> entry = Entry(decision.stream_id);
  auto pool = pools_.GetPool(decision.stream_id);
  if (!entry || !pool) return;

  const int64_t bandwidth = entry->last_bandwidth_bps > 0 ? entry->last_bandwidth_bps
                                                          : decision.new_quality.bitrate_bps;
  size_t capacity = pools_.PredictOptimalSize(entry->kind, bandwidth, decision.new_quality.name);
  // Emergencies never shrink the buffer they are trying to refill.
  if (decision.action == adaptation::AdaptationAction::kEmergency) {
    capacity = std::max(capacity, pool->Capacity());
  }
  if (capacity == pool->Capacity()) return;

  const size_t evicted = pools_.ResizePool(decision.stream_id, capacity);
  util::Logger::Debug("[StreamCore] POOL_RESIZE stream=" + decision.stream_id +
                      " capacity=" + std::to_string(capacity) +
                      " evicted=" + std::to_string(evicted));
  if (evicted > 0) {
    EvictionEvent event;
    event.stream_id = decision.stream_id;
    event.at_ms = decision.timeline.decided_at_ms;
    event.dropped_count = evicted;
    Publish(evictions_, std::move(event), "evictions");
  }
}

CycleReport StreamCore::RunCycle(int64_t now_ms) {
  CycleReport cycle;
  cycle.reconcile = coordinator_.Reconcile(now_ms);

  for (const auto& point : cycle.reconcile.completed) {
    ReleaseSyncPoint(point);
  }
  std::set<uint64_t> released;
  for (const auto& desync : cycle.reconcile.desyncs) {
    // Only expired points have left the table; others still pin their chunk.
    if (desync.reason == timing::kDesyncSyncPointExpired &&
        released.insert(desync.sync_point.id).second) {
      ReleaseSyncPoint(desync.sync_point);
    }
    Publish(desyncs_, desync, "desyncs");
  }
  for (const auto& stream_id : cycle.reconcile.emergency_streams) {
    if (engine_.SignalDesync(stream_id)) MarkUrgent(stream_id);
  }

  std::vector<std::string> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (next_evaluation_ms_ < 0 || now_ms >= next_evaluation_ms_) {
      cycle.full_evaluation = true;
      next_evaluation_ms_ = now_ms + config_.adaptation.evaluation_interval_ms;
      for (const auto& [id, entry] : streams_) targets.push_back(id);
    } else {
      targets.assign(urgent_.begin(), urgent_.end());
    }
    urgent_.clear();
  }

  for (const auto& stream_id : targets) {
    if (!engine_.HasStream(stream_id)) continue;
    RefreshSessionMetrics(stream_id, now_ms);
    std::optional<adaptation::AdaptationDecision> decision = engine_.Evaluate(stream_id);
    if (!decision || decision->action == adaptation::AdaptationAction::kMaintain) continue;
    ApplyDecision(*decision);
    Publish(decisions_, *decision, "decisions");
    cycle.decisions.push_back(std::move(*decision));
  }
  return cycle;
}

// ---------------------------------------------------------------------------
// Scheduling
// ---------------------------------------------------------------------------

void StreamCore::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load(std::memory_order_acquire)) return;
  stop_requested_.store(false, std::memory_order_release);
  wait_->Reset();
  running_.store(true, std::memory_order_release);
  worker_ = std::thread(&StreamCore::WorkerLoop, this);
  util::Logger::Info("[StreamCore] START interval_ms=" +
                     std::to_string(config_.sync.reconcile_interval_ms));
}

void StreamCore::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_.load(std::memory_order_acquire)) return;
  stop_requested_.store(true, std::memory_order_release);
  wait_->Cancel();
  if (worker_.joinable()) {
    worker_.join();
  }
  running_.store(false, std::memory_order_release);
  util::Logger::Info("[StreamCore] STOP");
}

void StreamCore::WorkerLoop() {
  int64_t deadline = clock_->now_utc_ms();
  while (!stop_requested_.load(std::memory_order_acquire)) {
    if (!wait_->WaitUntilMs(deadline)) break;
    if (stop_requested_.load(std::memory_order_acquire)) break;
    RunCycle(clock_->now_utc_ms());
    deadline += config_.sync.reconcile_interval_ms;
    // Skip ticks missed while a cycle overran instead of bursting.
    const int64_t now = clock_->now_utc_ms();
    if (deadline < now) deadline = now;
  }
}

}  // namespace streamcore::runtime
