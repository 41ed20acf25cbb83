// Repository: streamcore
// Component: Sync Coordinator
// Purpose: Master clock selection, drift estimation, bounded rate
//          corrections and SyncPoint reconciliation.
// Copyright (c) 2025 StreamCore

#include "streamcore/timing/SyncCoordinator.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "streamcore/util/Logger.hpp"

namespace streamcore::timing {

namespace {
constexpr double kMillion = 1'000'000.0;
constexpr double kDriftGain = 0.1;
// Remaining correction below this is treated as absorbed.
constexpr double kCorrectionEpsilonMs = 0.5;
}  // namespace

const char* ClockKindToString(ClockKind kind) {
  switch (kind) {
    case ClockKind::kLocal:   return "local";
    case ClockKind::kNetwork: return "network";
    case ClockKind::kMaster:  return "master";
  }
  return "unknown";
}

const char* SyncStateToString(SyncState state) {
  switch (state) {
    case SyncState::kUninitialized: return "UNINITIALIZED";
    case SyncState::kSynchronizing: return "SYNCHRONIZING";
    case SyncState::kSynchronized:  return "SYNCHRONIZED";
    case SyncState::kDesynced:      return "DESYNCED";
    case SyncState::kTerminated:    return "TERMINATED";
  }
  return "UNKNOWN";
}

const char* SyncActionToString(SyncAction action) {
  switch (action) {
    case SyncAction::kNone:       return "NONE";
    case SyncAction::kRateAdjust: return "RATE_ADJUST";
    case SyncAction::kDesync:     return "DESYNC";
    case SyncAction::kRejected:   return "REJECTED";
  }
  return "UNKNOWN";
}

SyncCoordinator::SyncCoordinator(std::shared_ptr<MasterClock> clock, SyncConfig config)
    : clock_(std::move(clock)), config_(config) {
  if (!clock_) {
    throw std::invalid_argument("SyncCoordinator requires a MasterClock");
  }
  if (config_.reconcile_interval_ms <= 0 || config_.sync_tolerance_ms < 0 ||
      config_.correction_window_ms <= config_.sync_tolerance_ms ||
      config_.correction_rate_limit <= 0.0 || config_.correction_rate_limit > 1.0 ||
      config_.max_rate_deviation <= 0.0) {
    util::Logger::Error("[SyncCoordinator] INVARIANT_VIOLATION invalid SyncConfig");
    throw std::invalid_argument("SyncConfig out of range");
  }
}

ClockReference SyncCoordinator::InitMasterClock(const std::vector<ClockSource>& sources) {
  std::lock_guard<std::mutex> lock(mutex_);

  ClockReference master;
  master.kind = ClockKind::kMaster;
  master.last_sync_ms = clock_->now_utc_ms();

  const ClockSource* best = nullptr;
  for (const auto& source : sources) {
    if (source.kind == ClockKind::kMaster) continue;
    if (best == nullptr || source.accuracy_ms < best->accuracy_ms ||
        (source.accuracy_ms == best->accuracy_ms &&
         source.kind == ClockKind::kNetwork && best->kind != ClockKind::kNetwork)) {
      best = &source;
    }
  }

  if (best != nullptr) {
    master.id = best->id;
    master.source = best->kind;
    master.frequency_hz = best->frequency_hz;
    master.accuracy_ms = best->accuracy_ms;
    master.offset_ms = best->offset_ms;
  } else {
    master.id = "local-master";
    master.source = ClockKind::kLocal;
    master.frequency_hz = clock_->frequency_hz();
    master.accuracy_ms = 1.0;
  }
  master.drift_ppm = clock_->drift_ppm();

  if (state_ == SyncState::kTerminated) {
    streams_.clear();
    sync_points_.clear();
    raised_desyncs_.clear();
  }
  master_ = master;
  state_ = SyncState::kSynchronizing;
  last_reconcile_ms_ = -1;

  std::ostringstream oss;
  oss << "[SyncCoordinator] MASTER_INIT id=" << master.id
      << " source=" << ClockKindToString(master.source)
      << " frequency_hz=" << master.frequency_hz
      << " accuracy_ms=" << master.accuracy_ms;
  util::Logger::Info(oss.str());
  return master;
}

bool SyncCoordinator::RegisterStreamClock(const std::string& stream_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!master_ || state_ == SyncState::kTerminated) return false;
  if (streams_.count(stream_id) > 0) return false;

  StreamClock stream;
  stream.reference.id = stream_id;
  stream.reference.kind = ClockKind::kLocal;
  stream.reference.source = ClockKind::kLocal;
  stream.reference.frequency_hz = master_->frequency_hz;
  stream.reference.accuracy_ms = master_->accuracy_ms;
  stream.reference.last_sync_ms = clock_->now_utc_ms();
  streams_.emplace(stream_id, stream);
  util::Logger::Debug("[SyncCoordinator] REGISTER stream=" + stream_id);
  return true;
}

bool SyncCoordinator::UnregisterStreamClock(const std::string& stream_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (streams_.erase(stream_id) == 0) return false;
  for (auto& [id, pending] : sync_points_) {
    pending.point.dependencies.erase(stream_id);
    pending.arrived.erase(stream_id);
  }
  raised_desyncs_.erase(
      std::remove_if(raised_desyncs_.begin(), raised_desyncs_.end(),
                     [&stream_id](const DesyncEvent& e) { return e.stream_id == stream_id; }),
      raised_desyncs_.end());
  RefreshStateLocked();
  util::Logger::Debug("[SyncCoordinator] UNREGISTER stream=" + stream_id);
  return true;
}

bool SyncCoordinator::ReportPlayoutTime(const std::string& stream_id, int64_t playout_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(stream_id);
  if (it == streams_.end()) return false;
  StreamClock& stream = it->second;

  const int64_t master_ms = clock_->now_utc_ms();
  if (stream.has_playout) {
    const int64_t dm = master_ms - stream.last_master_ms;
    const int64_t dp = playout_ms - stream.last_playout_ms;
    if (dm > 0) {
      const double sample = static_cast<double>(dp - dm) / static_cast<double>(dm) * kMillion;
      stream.reference.drift_ppm += kDriftGain * (sample - stream.reference.drift_ppm);
    }
  }
  stream.has_playout = true;
  stream.last_playout_ms = playout_ms;
  stream.last_master_ms = master_ms;
  stream.reference.last_sync_ms = master_ms;
  return true;
}

void SyncCoordinator::UpdateNetworkEstimate(double offset_ms, int64_t rtt_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!master_) return;
  master_->offset_ms += config_.network_offset_gain * (offset_ms - master_->offset_ms);
  master_->accuracy_ms = static_cast<double>(std::max<int64_t>(0, rtt_ms)) / 2.0;
  master_->last_sync_ms = clock_->now_utc_ms();
  util::Logger::Debug("[SyncCoordinator] NETWORK_SAMPLE offset_ms=" +
                      std::to_string(master_->offset_ms) +
                      " accuracy_ms=" + std::to_string(master_->accuracy_ms));
}

uint64_t SyncCoordinator::AddSyncPoint(SyncPoint point) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!master_ || state_ == SyncState::kTerminated) return 0;
  if (point.dependencies.empty()) return 0;

  point.id = next_sync_point_id_++;
  if (point.tolerance_ms <= 0) {
    point.tolerance_ms = config_.sync_tolerance_ms;
  }
  if (point.expires_at_ms <= 0) {
    point.expires_at_ms = clock_->now_utc_ms() + config_.sync_point_ttl_ms;
  }
  const uint64_t id = point.id;
  util::Logger::Debug("[SyncCoordinator] SYNC_POINT_ADD id=" + std::to_string(id) +
                      " ts=" + std::to_string(point.timestamp_ms) +
                      " deps=" + std::to_string(point.dependencies.size()));
  sync_points_.emplace(id, PendingPoint{std::move(point), {}});
  return id;
}

SyncVerdict SyncCoordinator::ReportArrival(uint64_t sync_point_id,
                                           const std::string& stream_id,
                                           int64_t playout_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  SyncVerdict verdict;
  verdict.stream_id = stream_id;
  verdict.sync_point_id = sync_point_id;

  if (state_ == SyncState::kUninitialized || state_ == SyncState::kTerminated) {
    return verdict;
  }
  auto sp = sync_points_.find(sync_point_id);
  auto st = streams_.find(stream_id);
  if (sp == sync_points_.end() || st == streams_.end() ||
      sp->second.point.dependencies.count(stream_id) == 0) {
    return verdict;
  }

  StreamClock& stream = st->second;
  stream.has_playout = true;
  stream.last_playout_ms = playout_ms;
  stream.last_master_ms = clock_->now_utc_ms();

  const double adjustment = static_cast<double>(sp->second.point.timestamp_ms) -
                            (static_cast<double>(playout_ms) + stream.reference.offset_ms);
  verdict = EvaluateLocked(stream, stream_id, adjustment,
                           sp->second.point.tolerance_ms, sync_point_id);
  if (verdict.action == SyncAction::kNone) {
    sp->second.arrived.insert(stream_id);
  }
  return verdict;
}

std::vector<SyncVerdict> SyncCoordinator::Synchronize(const std::vector<std::string>& stream_ids,
                                                      int64_t reference_time_ms,
                                                      int64_t tolerance_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SyncVerdict> verdicts;
  verdicts.reserve(stream_ids.size());
  const bool active = state_ != SyncState::kUninitialized && state_ != SyncState::kTerminated;

  for (const auto& stream_id : stream_ids) {
    auto it = streams_.find(stream_id);
    if (!active || it == streams_.end() || !it->second.has_playout) {
      SyncVerdict rejected;
      rejected.stream_id = stream_id;
      verdicts.push_back(rejected);
      continue;
    }
    StreamClock& stream = it->second;
    const double adjustment =
        static_cast<double>(reference_time_ms) -
        (static_cast<double>(stream.last_playout_ms) + stream.reference.offset_ms);
    verdicts.push_back(EvaluateLocked(stream, stream_id, adjustment,
                                      ToleranceFor(tolerance_ms), 0));
  }
  RefreshStateLocked();
  return verdicts;
}

SyncVerdict SyncCoordinator::EvaluateLocked(StreamClock& stream, const std::string& stream_id,
                                            double adjustment_ms, int64_t tolerance_ms,
                                            uint64_t sync_point_id) {
  SyncVerdict verdict;
  verdict.stream_id = stream_id;
  verdict.adjustment_ms = adjustment_ms;
  verdict.sync_point_id = sync_point_id;

  ClockReference& ref = stream.reference;
  const double magnitude = std::abs(adjustment_ms);
  const double interval = static_cast<double>(config_.reconcile_interval_ms);

  if (magnitude <= static_cast<double>(tolerance_ms)) {
    ref.pending_correction_ms = 0.0;
    if (stream.desynced) {
      stream.desynced = false;
      util::Logger::Info("[SyncCoordinator] RESYNCED stream=" + stream_id);
    }
    verdict.action = SyncAction::kNone;
    verdict.rate = ref.rate;
    return verdict;
  }

  ref.pending_correction_ms = adjustment_ms;
  ref.rate = ClampRateLocked(stream.cycle_start_rate, 1.0 + adjustment_ms / interval);
  verdict.rate = ref.rate;
  corrections_total_++;

  std::ostringstream oss;
  oss << " stream=" << stream_id << " adjustment_ms=" << adjustment_ms
      << " tolerance_ms=" << tolerance_ms << " rate=" << ref.rate;

  if (magnitude <= static_cast<double>(config_.correction_window_ms)) {
    verdict.action = SyncAction::kRateAdjust;
    util::Logger::Debug("[SyncCoordinator] RATE_ADJUST" + oss.str());
    return verdict;
  }

  verdict.action = SyncAction::kDesync;
  if (!stream.desynced) {
    stream.desynced = true;
    desync_total_++;
    DesyncEvent event;
    event.stream_id = stream_id;
    event.reason = kDesyncWindowExceeded;
    auto sp = sync_points_.find(sync_point_id);
    if (sp != sync_points_.end()) event.sync_point = sp->second.point;
    raised_desyncs_.push_back(std::move(event));
  }
  state_ = SyncState::kDesynced;
  util::Logger::Warn("[SyncCoordinator] DESYNC" + oss.str());
  return verdict;
}

double SyncCoordinator::ClampRateLocked(double cycle_start_rate, double desired_rate) const {
  const double stepped = std::clamp(desired_rate,
                                    cycle_start_rate - config_.correction_rate_limit,
                                    cycle_start_rate + config_.correction_rate_limit);
  return std::clamp(stepped, 1.0 - config_.max_rate_deviation,
                    1.0 + config_.max_rate_deviation);
}

void SyncCoordinator::StepCorrectionLocked(StreamClock& stream, int64_t elapsed_ms,
                                           int64_t tolerance_ms) {
  ClockReference& ref = stream.reference;
  const double interval = static_cast<double>(config_.reconcile_interval_ms);

  if (ref.pending_correction_ms != 0.0) {
    double applied = (ref.rate - 1.0) * static_cast<double>(elapsed_ms);
    const bool same_direction = (applied > 0.0) == (ref.pending_correction_ms > 0.0);
    if (same_direction && std::abs(applied) >= std::abs(ref.pending_correction_ms)) {
      applied = ref.pending_correction_ms;
    }
    ref.offset_ms += applied;
    ref.pending_correction_ms -= applied;
    if (std::abs(ref.pending_correction_ms) <= kCorrectionEpsilonMs) {
      ref.pending_correction_ms = 0.0;
    }
  }

  const double desired = ref.pending_correction_ms == 0.0
      ? 1.0
      : 1.0 + ref.pending_correction_ms / interval;
  ref.rate = ClampRateLocked(stream.cycle_start_rate, desired);
  ref.last_sync_ms = clock_->now_utc_ms();

  if (stream.desynced &&
      std::abs(ref.pending_correction_ms) <= static_cast<double>(tolerance_ms)) {
    stream.desynced = false;
    util::Logger::Info("[SyncCoordinator] RESYNCED stream=" + ref.id);
  }
}

ReconcileReport SyncCoordinator::Reconcile(int64_t now_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  ReconcileReport report;
  if (state_ == SyncState::kUninitialized || state_ == SyncState::kTerminated) {
    report.state = state_;
    return report;
  }

  int64_t elapsed = config_.reconcile_interval_ms;
  if (last_reconcile_ms_ >= 0) {
    elapsed = std::clamp<int64_t>(now_ms - last_reconcile_ms_, 0,
                                  config_.reconcile_interval_ms * 10);
  }
  last_reconcile_ms_ = now_ms;

  for (auto& [stream_id, stream] : streams_) {
    if (stream.reference.pending_correction_ms == 0.0 && stream.reference.rate == 1.0) {
      stream.cycle_start_rate = 1.0;
      continue;
    }
    StepCorrectionLocked(stream, elapsed, config_.sync_tolerance_ms);
    stream.cycle_start_rate = stream.reference.rate;
    SyncVerdict step;
    step.stream_id = stream_id;
    step.action = SyncAction::kRateAdjust;
    step.adjustment_ms = stream.reference.pending_correction_ms;
    step.rate = stream.reference.rate;
    report.corrections.push_back(step);
  }

  auto request_emergency = [&report](const std::string& stream_id) {
    if (std::find(report.emergency_streams.begin(), report.emergency_streams.end(),
                  stream_id) == report.emergency_streams.end()) {
      report.emergency_streams.push_back(stream_id);
    }
  };
  for (auto& event : raised_desyncs_) {
    request_emergency(event.stream_id);
    report.desyncs.push_back(std::move(event));
  }
  raised_desyncs_.clear();

  for (auto it = sync_points_.begin(); it != sync_points_.end();) {
    const SyncPoint& point = it->second.point;
    std::vector<std::string> missing;
    for (const auto& dep : point.dependencies) {
      if (it->second.arrived.count(dep) == 0) missing.push_back(dep);
    }

    if (missing.empty()) {
      completed_total_++;
      report.completed.push_back(point);
      it = sync_points_.erase(it);
      continue;
    }

    if (now_ms >= point.expires_at_ms) {
      expired_total_++;
      for (const auto& stream_id : missing) {
        report.desyncs.push_back(DesyncEvent{stream_id, point, kDesyncSyncPointExpired});
        auto st = streams_.find(stream_id);
        if (st != streams_.end() && !st->second.desynced) {
          st->second.desynced = true;
        }
        desync_total_++;
        request_emergency(stream_id);
        util::Logger::Warn("[SyncCoordinator] SYNC_POINT_EXPIRED id=" +
                           std::to_string(point.id) + " stream=" + stream_id +
                           " ts=" + std::to_string(point.timestamp_ms));
      }
      it = sync_points_.erase(it);
      continue;
    }
    ++it;
  }

  RefreshStateLocked();
  report.state = state_;
  util::Logger::Debug("[SyncCoordinator] RECONCILE state=" +
                      std::string(SyncStateToString(state_)) +
                      " corrections=" + std::to_string(report.corrections.size()) +
                      " completed=" + std::to_string(report.completed.size()) +
                      " desyncs=" + std::to_string(report.desyncs.size()));
  return report;
}

std::vector<DesyncEvent> SyncCoordinator::TakeDesyncs() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DesyncEvent> taken;
  taken.swap(raised_desyncs_);
  return taken;
}

std::vector<uint64_t> SyncCoordinator::NotifyEvictionBlocked(
    const std::string& stream_id, const std::vector<uint64_t>& sequences) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<uint64_t> ids;
  for (const auto& [id, pending] : sync_points_) {
    if (pending.point.stream_id == stream_id &&
        std::find(sequences.begin(), sequences.end(), pending.point.chunk_ref) !=
            sequences.end()) {
      ids.push_back(id);
    }
  }
  if (!ids.empty()) {
    eviction_conflicts_++;
    util::Logger::Warn("[SyncCoordinator] EVICTION_BLOCKED stream=" + stream_id +
                       " sync_points=" + std::to_string(ids.size()));
  }
  return ids;
}

void SyncCoordinator::Terminate() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = SyncState::kTerminated;
  sync_points_.clear();
  raised_desyncs_.clear();
  util::Logger::Info("[SyncCoordinator] TERMINATED");
}

void SyncCoordinator::RefreshStateLocked() {
  if (state_ == SyncState::kUninitialized || state_ == SyncState::kTerminated) return;

  bool any_desynced = false;
  bool any_pending = false;
  for (const auto& [id, stream] : streams_) {
    any_desynced = any_desynced || stream.desynced;
    any_pending = any_pending ||
        std::abs(stream.reference.pending_correction_ms) >
            static_cast<double>(config_.sync_tolerance_ms);
  }

  const SyncState previous = state_;
  if (any_desynced) {
    state_ = SyncState::kDesynced;
  } else if (state_ == SyncState::kDesynced ||
             (state_ == SyncState::kSynchronizing && !any_pending)) {
    state_ = SyncState::kSynchronized;
  }
  if (previous != state_) {
    util::Logger::Info(std::string("[SyncCoordinator] STATE ") +
                       SyncStateToString(previous) + " -> " + SyncStateToString(state_));
  }
}

int64_t SyncCoordinator::ToleranceFor(int64_t tolerance_ms) const {
  return tolerance_ms > 0 ? tolerance_ms : config_.sync_tolerance_ms;
}

SyncState SyncCoordinator::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::optional<ClockReference> SyncCoordinator::master() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return master_;
}

std::optional<ClockReference> SyncCoordinator::clock(const std::string& stream_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(stream_id);
  if (it == streams_.end()) return std::nullopt;
  return it->second.reference;
}

std::vector<SyncPoint> SyncCoordinator::PendingSyncPoints() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SyncPoint> points;
  points.reserve(sync_points_.size());
  for (const auto& [id, pending] : sync_points_) points.push_back(pending.point);
  return points;
}

bool SyncCoordinator::IsStreamDesynced(const std::string& stream_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(stream_id);
  return it != streams_.end() && it->second.desynced;
}

SyncStatistics SyncCoordinator::Statistics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  SyncStatistics stats;
  stats.state = state_;
  stats.stream_clocks = streams_.size();
  stats.pending_sync_points = sync_points_.size();
  for (const auto& [id, stream] : streams_) {
    if (stream.desynced) stats.desynced_streams++;
  }
  stats.completed_sync_points = completed_total_;
  stats.expired_sync_points = expired_total_;
  stats.corrections = corrections_total_;
  stats.desync_events = desync_total_;
  stats.eviction_conflicts = eviction_conflicts_;
  if (master_) {
    stats.master_accuracy_ms = master_->accuracy_ms;
    stats.master_offset_ms = master_->offset_ms;
  }
  return stats;
}

}  // namespace streamcore::timing
