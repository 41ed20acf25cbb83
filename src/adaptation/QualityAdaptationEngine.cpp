// Repository: streamcore
// Component: Quality Adaptation Engine
// Purpose: Emergency path, hysteresis/dwell gating and constraint clamping
//          around the pluggable scorer.
// Copyright (c) 2025 StreamCore

#include "streamcore/adaptation/QualityAdaptationEngine.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "streamcore/util/Logger.hpp"

namespace streamcore::adaptation {

namespace {

constexpr double kLatencyPerRungMs = 25.0;
constexpr double kCpuPerRatio = 20.0;
constexpr double kBatteryPerRatio = 15.0;
constexpr double kUxPerRung = 20.0;
constexpr double kStaleConfidenceFloor = 0.2;

constexpr double kTriggerPacketLoss = 0.05;
constexpr int64_t kTriggerRttMs = 300;
constexpr double kTriggerBandwidthShortfall = 0.8;
constexpr double kTriggerBufferHealth = 0.3;
constexpr double kTriggerErrorRate = 0.1;
constexpr uint64_t kTriggerRebuffering = 3;
constexpr double kTriggerCpu = 0.9;
constexpr double kTriggerMemory = 0.85;
constexpr double kTriggerBandwidthSurplus = 1.5;

int64_t TransitionMs(AdaptationSpeed speed) {
  switch (speed) {
    case AdaptationSpeed::kSlow:   return 2'000;
    case AdaptationSpeed::kMedium: return 1'000;
    case AdaptationSpeed::kFast:   return 500;
  }
  return 1'000;
}

bool HasPendingEmergency(const AdaptationContext& context) {
  return context.pending_underrun || context.pending_desync ||
         !context.pending_emergency_reason.empty();
}

std::optional<size_t> ParseRungIndex(const std::string& text) {
  if (text.empty() || text.size() > 3) return std::nullopt;
  for (char c : text) {
    if (c < '0' || c > '9') return std::nullopt;
  }
  return static_cast<size_t>(std::strtoul(text.c_str(), nullptr, 10));
}

}  // namespace

const char* StartStreamResultToString(StartStreamResult result) {
  switch (result) {
    case StartStreamResult::kStarted:       return "started";
    case StartStreamResult::kAlreadyExists: return "already_exists";
    case StartStreamResult::kEmptyLadder:   return "empty_ladder";
    case StartStreamResult::kNoValidRung:   return "no_valid_rung";
  }
  return "unknown";
}

const char* ForceResultToString(ForceResult result) {
  switch (result) {
    case ForceResult::kApplied:               return "applied";
    case ForceResult::kUnknownStream:         return "unknown_stream";
    case ForceResult::kUnknownQuality:        return "unknown_quality";
    case ForceResult::kConstraintViolation:   return "constraint_violation";
    case ForceResult::kPreemptedByEmergency:  return "preempted_by_emergency";
  }
  return "unknown";
}

QualityAdaptationEngine::QualityAdaptationEngine(std::shared_ptr<timing::MasterClock> clock,
                                                 AdaptationConfig config,
                                                 std::unique_ptr<IQualityScorer> scorer)
    : clock_(std::move(clock)), config_(std::move(config)), scorer_(std::move(scorer)) {
  if (!clock_) {
    throw std::invalid_argument("QualityAdaptationEngine requires a MasterClock");
  }
  if (config_.dwell_time_ms < 0 || config_.history_limit == 0 ||
      config_.sample_stale_ms <= config_.sample_fresh_ms) {
    util::Logger::Error("[QualityAdaptation] INVARIANT_VIOLATION invalid AdaptationConfig");
    throw std::invalid_argument("invalid AdaptationConfig");
  }
  if (!scorer_) {
    scorer_ = std::make_unique<RuleBasedQualityScorer>(config_.rules);
  }
}

// ---------------------------------------------------------------------------
// Stream lifecycle
// ---------------------------------------------------------------------------

StartStreamResult QualityAdaptationEngine::AddStream(const std::string& stream_id,
                                                     MediaKind kind,
                                                     codec::QualityLadder ladder,
                                                     const UserPreferences& preferences,
                                                     const QualityConstraints& constraints) {
  if (ladder.empty()) return StartStreamResult::kEmptyLadder;
  for (size_t i = 0; i < ladder.size(); ++i) ladder[i].index = i;

  auto slot = std::make_shared<StreamSlot>();
  AdaptationContext& context = slot->context;
  context.stream_id = stream_id;
  context.kind = kind;
  context.ladder = std::move(ladder);
  context.preferences = preferences;
  context.constraints = constraints;
  context.created_at_ms = clock_->now_utc_ms();

  const std::optional<size_t> lowest = LowestValidRung(context);
  if (!lowest) {
    util::Logger::Warn("[QualityAdaptation] START_REJECTED stream=" + stream_id +
                       " reason=no_valid_rung");
    return StartStreamResult::kNoValidRung;
  }

  // Start in the lower half of the ladder and let upgrades earn the rest.
  size_t initial = *lowest;
  const size_t middle = (context.ladder.size() - 1) / 2;
  for (size_t i = *lowest; i <= middle; ++i) {
    const codec::QualityLevel& level = context.ladder[i];
    if (!SatisfiesConstraints(level, kind, constraints)) continue;
    if (preferences.max_bitrate_bps > 0 && level.bitrate_bps > preferences.max_bitrate_bps) {
      continue;
    }
    initial = i;
  }
  context.current_rung = initial;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (streams_.count(stream_id) != 0) return StartStreamResult::kAlreadyExists;
    streams_.emplace(stream_id, slot);
  }

  std::ostringstream oss;
  oss << "[QualityAdaptation] STREAM_START stream=" << stream_id
      << " kind=" << MediaKindToString(kind)
      << " rungs=" << context.ladder.size()
      << " initial=" << context.current().name;
  util::Logger::Info(oss.str());
  return StartStreamResult::kStarted;
}

bool QualityAdaptationEngine::RemoveStream(const std::string& stream_id) {
  std::shared_ptr<StreamSlot> slot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) return false;
    slot = it->second;
    streams_.erase(it);
  }
  // Anyone still holding the slot sees it as gone on their next operation.
  std::lock_guard<std::mutex> slot_lock(slot->mutex);
  slot->removed = true;
  util::Logger::Info("[QualityAdaptation] STREAM_END stream=" + stream_id);
  return true;
}

bool QualityAdaptationEngine::HasStream(const std::string& stream_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return streams_.count(stream_id) != 0;
}

std::shared_ptr<QualityAdaptationEngine::StreamSlot> QualityAdaptationEngine::Slot(
    const std::string& stream_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(stream_id);
  return it == streams_.end() ? nullptr : it->second;
}

// ---------------------------------------------------------------------------
// Inputs
// ---------------------------------------------------------------------------

bool QualityAdaptationEngine::UpdateNetworkConditions(const std::string& stream_id,
                                                      NetworkConditions conditions) {
  auto slot = Slot(stream_id);
  if (!slot) return false;
  std::lock_guard<std::mutex> lock(slot->mutex);
  if (slot->removed) return false;
  if (conditions.sampled_at_ms == 0) conditions.sampled_at_ms = clock_->now_utc_ms();
  slot->context.network = conditions;
  slot->context.has_network_sample = true;
  return true;
}

bool QualityAdaptationEngine::UpdateDeviceCapabilities(const std::string& stream_id,
                                                       DeviceCapabilities capabilities) {
  auto slot = Slot(stream_id);
  if (!slot) return false;
  std::lock_guard<std::mutex> lock(slot->mutex);
  if (slot->removed) return false;
  if (capabilities.sampled_at_ms == 0) capabilities.sampled_at_ms = clock_->now_utc_ms();
  slot->context.device = capabilities;
  slot->context.has_device_sample = true;
  return true;
}

bool QualityAdaptationEngine::UpdateSessionMetrics(const std::string& stream_id,
                                                   const SessionMetrics& metrics) {
  auto slot = Slot(stream_id);
  if (!slot) return false;
  std::lock_guard<std::mutex> lock(slot->mutex);
  if (slot->removed) return false;
  // quality_changes is owned by the engine.
  const uint64_t changes = slot->context.metrics.quality_changes;
  slot->context.metrics = metrics;
  slot->context.metrics.quality_changes = changes;
  return true;
}

bool QualityAdaptationEngine::SignalUnderrun(const std::string& stream_id) {
  auto slot = Slot(stream_id);
  if (!slot) return false;
  std::lock_guard<std::mutex> lock(slot->mutex);
  if (slot->removed) return false;
  slot->context.pending_underrun = true;
  ++slot->context.metrics.rebuffering_events;
  return true;
}

bool QualityAdaptationEngine::SignalDesync(const std::string& stream_id) {
  auto slot = Slot(stream_id);
  if (!slot) return false;
  std::lock_guard<std::mutex> lock(slot->mutex);
  if (slot->removed) return false;
  slot->context.pending_desync = true;
  return true;
}

bool QualityAdaptationEngine::SignalEmergency(const std::string& stream_id,
                                              const std::string& reason) {
  auto slot = Slot(stream_id);
  if (!slot) return false;
  std::lock_guard<std::mutex> lock(slot->mutex);
  if (slot->removed) return false;
  slot->context.pending_emergency_reason = reason.empty() ? "emergency" : reason;
  return true;
}

// ---------------------------------------------------------------------------
// Evaluation
// ---------------------------------------------------------------------------

bool QualityAdaptationEngine::ShouldConsiderAdaptation(const AdaptationContext& context,
                                                       const RuleConfig& rules) {
  const double current_bps = static_cast<double>(context.current().bitrate_bps);
  if (context.has_network_sample) {
    const NetworkConditions& net = context.network;
    const double bandwidth = static_cast<double>(net.bandwidth_bps);
    if (net.packet_loss > kTriggerPacketLoss) return true;
    if (net.rtt_ms > kTriggerRttMs) return true;
    if (bandwidth < current_bps * kTriggerBandwidthShortfall) return true;
    if (context.preferences.auto_adjust &&
        bandwidth > current_bps * std::max(kTriggerBandwidthSurplus, rules.upgrade_headroom)) {
      return true;
    }
  }
  const SessionMetrics& metrics = context.metrics;
  if (metrics.buffer_health < kTriggerBufferHealth) return true;
  if (metrics.error_rate > kTriggerErrorRate) return true;
  if (metrics.rebuffering_events > kTriggerRebuffering) return true;
  if (context.has_device_sample) {
    if (context.device.cpu_usage > kTriggerCpu) return true;
    if (context.device.memory_usage > kTriggerMemory) return true;
  }
  return false;
}

std::optional<AdaptationDecision> QualityAdaptationEngine::Evaluate(const std::string& stream_id) {
  auto slot = Slot(stream_id);
  if (!slot) return std::nullopt;

  AdaptationDecision decision;
  {
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->removed) return std::nullopt;
    AdaptationContext& context = slot->context;
    const int64_t now_ms = clock_->now_utc_ms();
    const size_t current = context.current_rung;
    const std::optional<size_t> lowest = LowestValidRung(context);
    // Constraints are fixed at AddStream, so a valid rung always exists.
    const size_t floor_rung = lowest ? *lowest : 0;

    // Emergency path: no hysteresis, no dwell, no scorer.
    std::string emergency_reason;
    if (context.pending_underrun) {
      emergency_reason = "buffer-underrun";
    } else if (context.pending_desync) {
      emergency_reason = "sync-desync";
    } else if (!context.pending_emergency_reason.empty()) {
      emergency_reason = context.pending_emergency_reason;
    } else if (context.has_network_sample && current > floor_rung &&
               context.network.bandwidth_bps < context.ladder[floor_rung].bitrate_bps) {
      emergency_reason = "bandwidth-below-ladder";
    }

    if (!emergency_reason.empty()) {
      decision = MakeDecision(context, AdaptationAction::kEmergency, floor_rung,
                              emergency_reason, 1.0, now_ms, true);
      context.pending_underrun = false;
      context.pending_desync = false;
      context.pending_emergency_reason.clear();
      context.last_emergency_ms = now_ms;
      Commit(context, decision, now_ms);
      std::ostringstream oss;
      oss << "[QualityAdaptation] EMERGENCY stream=" << stream_id
          << " reason=" << emergency_reason
          << " from=" << decision.previous_quality.name
          << " to=" << decision.new_quality.name;
      util::Logger::Warn(oss.str());
    } else {
      const double freshness = SampleFreshness(context, now_ms);
      if (!ShouldConsiderAdaptation(context, config_.rules)) {
        decision = MakeDecision(context, AdaptationAction::kMaintain, current,
                                "no-trigger", freshness, now_ms, false);
      } else {
        const ScoredCandidate candidate = scorer_->Propose(context, now_ms);
        const size_t proposed = std::min(candidate.rung, context.ladder.size() - 1);
        const size_t distance = proposed > current ? proposed - current : current - proposed;
        const bool dwelling = context.last_decision_ms >= 0 &&
                              now_ms - context.last_decision_ms < EffectiveDwellMs(context);
        const size_t target = NearestValidRung(context, proposed);
        const double confidence = std::clamp(candidate.confidence * freshness, 0.0, 1.0);

        if (distance <= config_.hysteresis_rungs) {
          decision = MakeDecision(context, AdaptationAction::kMaintain, current,
                                  "hysteresis", confidence, now_ms, false);
        } else if (dwelling) {
          decision = MakeDecision(context, AdaptationAction::kMaintain, current,
                                  "dwell", confidence, now_ms, false);
        } else if (target == current) {
          decision = MakeDecision(context, AdaptationAction::kMaintain, current,
                                  "constraint-clamped", confidence, now_ms, false);
        } else {
          const AdaptationAction action = target > current ? AdaptationAction::kUpgrade
                                                           : AdaptationAction::kDowngrade;
          decision = MakeDecision(context, action, target, candidate.reason, confidence,
                                  now_ms, false);
          for (const auto& rule : candidate.fired_rules) {
            context.rule_last_fired[rule] = now_ms;
          }
          Commit(context, decision, now_ms);
          std::ostringstream oss;
          oss << "[QualityAdaptation] DECISION stream=" << stream_id
              << " action=" << AdaptationActionToString(action)
              << " reason=" << candidate.reason
              << " from=" << decision.previous_quality.name
              << " to=" << decision.new_quality.name
              << " confidence=" << decision.confidence;
          util::Logger::Info(oss.str());
        }
      }
    }
  }

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++totals_.total_decisions;
    ++totals_.by_action[AdaptationActionToString(decision.action)];
    ++totals_.by_reason[decision.reason];
    if (decision.action == AdaptationAction::kEmergency) ++totals_.emergencies;
    confidence_sum_ += decision.confidence;
    ux_impact_sum_ += decision.estimated_impact.ux;
  }
  return decision;
}

// ---------------------------------------------------------------------------
// Forced changes
// ---------------------------------------------------------------------------

ForceOutcome QualityAdaptationEngine::ForceQualityChange(const std::string& stream_id,
                                                         const std::string& target_quality,
                                                         const std::string& reason) {
  ForceOutcome outcome;
  auto slot = Slot(stream_id);
  if (!slot) {
    outcome.result = ForceResult::kUnknownStream;
    return outcome;
  }

  {
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->removed) {
      outcome.result = ForceResult::kUnknownStream;
      return outcome;
    }
    AdaptationContext& context = slot->context;
    const int64_t now_ms = clock_->now_utc_ms();

    // An emergency that is pending, or was applied within the dwell window,
    // wins over any forced target.
    const bool recent_emergency = context.last_emergency_ms >= 0 &&
                                  now_ms - context.last_emergency_ms < EffectiveDwellMs(context);
    std::optional<size_t> rung;
    for (const auto& level : context.ladder) {
      if (level.name == target_quality) rung = level.index;
    }
    if (!rung) {
      const auto index = ParseRungIndex(target_quality);
      if (index && *index < context.ladder.size()) rung = index;
    }

    if (HasPendingEmergency(context) || recent_emergency) {
      outcome.result = ForceResult::kPreemptedByEmergency;
    } else if (!rung) {
      outcome.result = ForceResult::kUnknownQuality;
    } else if (!SatisfiesConstraints(context.ladder[*rung], context.kind, context.constraints)) {
      outcome.result = ForceResult::kConstraintViolation;
    } else {
      outcome.result = ForceResult::kApplied;
    }

    if (outcome.result != ForceResult::kApplied) {
      util::Logger::Warn("[QualityAdaptation] FORCE_REJECTED stream=" + stream_id +
                         " target=" + target_quality +
                         " result=" + ForceResultToString(outcome.result));
      return outcome;
    }

    AdaptationAction action = AdaptationAction::kMaintain;
    if (*rung > context.current_rung) action = AdaptationAction::kUpgrade;
    if (*rung < context.current_rung) action = AdaptationAction::kDowngrade;
    AdaptationDecision decision =
        MakeDecision(context, action, *rung, reason.empty() ? "forced" : reason, 1.0, now_ms, true);
    decision.forced = true;
    Commit(context, decision, now_ms);
    outcome.decision = decision;
    util::Logger::Info("[QualityAdaptation] FORCED stream=" + stream_id +
                       " to=" + decision.new_quality.name + " reason=" + decision.reason);
  }

  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++totals_.total_decisions;
  ++totals_.forced;
  ++totals_.by_action[AdaptationActionToString(outcome.decision->action)];
  ++totals_.by_reason[outcome.decision->reason];
  confidence_sum_ += outcome.decision->confidence;
  ux_impact_sum_ += outcome.decision->estimated_impact.ux;
  return outcome;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::optional<size_t> QualityAdaptationEngine::LowestValidRung(
    const AdaptationContext& context) const {
  for (const auto& level : context.ladder) {
    if (SatisfiesConstraints(level, context.kind, context.constraints)) return level.index;
  }
  return std::nullopt;
}

size_t QualityAdaptationEngine::NearestValidRung(const AdaptationContext& context,
                                                 size_t rung) const {
  const size_t n = context.ladder.size();
  for (size_t step = 0; step < n; ++step) {
    // Prefer the lower neighbour: it never exceeds what the scorer allowed.
    if (rung >= step &&
        SatisfiesConstraints(context.ladder[rung - step], context.kind, context.constraints)) {
      return rung - step;
    }
    if (rung + step < n &&
        SatisfiesConstraints(context.ladder[rung + step], context.kind, context.constraints)) {
      return rung + step;
    }
  }
  return context.current_rung;
}

int64_t QualityAdaptationEngine::EffectiveDwellMs(const AdaptationContext& context) const {
  switch (context.preferences.speed) {
    case AdaptationSpeed::kSlow: return config_.dwell_time_ms * 2;
    case AdaptationSpeed::kFast: return config_.dwell_time_ms / 2;
    case AdaptationSpeed::kMedium: break;
  }
  return config_.dwell_time_ms;
}

double QualityAdaptationEngine::SampleFreshness(const AdaptationContext& context,
                                                int64_t now_ms) const {
  if (!context.has_network_sample) return 1.0;
  const int64_t age = now_ms - context.network.sampled_at_ms;
  if (age <= config_.sample_fresh_ms) return 1.0;
  if (age >= config_.sample_stale_ms) return kStaleConfidenceFloor;
  const double span = static_cast<double>(config_.sample_stale_ms - config_.sample_fresh_ms);
  const double t = static_cast<double>(age - config_.sample_fresh_ms) / span;
  return 1.0 - t * (1.0 - kStaleConfidenceFloor);
}

EstimatedImpact QualityAdaptationEngine::EstimateImpact(const codec::QualityLevel& from,
                                                        const codec::QualityLevel& to) {
  EstimatedImpact impact;
  const double rungs = static_cast<double>(to.index) - static_cast<double>(from.index);
  impact.latency_ms = rungs * kLatencyPerRungMs;
  impact.bandwidth_bps = static_cast<double>(to.bitrate_bps - from.bitrate_bps);
  if (from.bitrate_bps > 0) {
    const double ratio = static_cast<double>(to.bitrate_bps) / static_cast<double>(from.bitrate_bps);
    impact.cpu = (ratio - 1.0) * kCpuPerRatio;
    impact.battery = (ratio - 1.0) * kBatteryPerRatio;
  }
  impact.ux = std::clamp(rungs * kUxPerRung, -100.0, 100.0);
  return impact;
}

AdaptationDecision QualityAdaptationEngine::MakeDecision(const AdaptationContext& context,
                                                         AdaptationAction action, size_t rung,
                                                         std::string reason, double confidence,
                                                         int64_t now_ms, bool immediate) const {
  AdaptationDecision decision;
  decision.stream_id = context.stream_id;
  decision.action = action;
  decision.reason = std::move(reason);
  decision.confidence = std::clamp(confidence, 0.0, 1.0);
  decision.previous_quality = context.current();
  decision.new_quality = context.ladder[rung];
  decision.estimated_impact = EstimateImpact(decision.previous_quality, decision.new_quality);
  decision.timeline.immediate = immediate;
  decision.timeline.decided_at_ms = now_ms;
  decision.timeline.transition_ms = immediate ? 0 : TransitionMs(context.preferences.speed);
  if (action != AdaptationAction::kMaintain) {
    decision.rollback_plan = decision.previous_quality;
  }
  return decision;
}

void QualityAdaptationEngine::Commit(AdaptationContext& context,
                                     const AdaptationDecision& decision, int64_t now_ms) {
  if (decision.new_quality.index != context.current_rung) {
    ++context.metrics.quality_changes;
  }
  context.current_rung = decision.new_quality.index;
  context.target_rung.reset();
  context.last_decision_ms = now_ms;
  context.history.push_back(decision);
  while (context.history.size() > config_.history_limit) {
    context.history.pop_front();
  }
}

// ---------------------------------------------------------------------------
// Introspection
// ---------------------------------------------------------------------------

std::optional<AdaptationContext> QualityAdaptationEngine::Context(
    const std::string& stream_id) const {
  auto slot = Slot(stream_id);
  if (!slot) return std::nullopt;
  std::lock_guard<std::mutex> lock(slot->mutex);
  if (slot->removed) return std::nullopt;
  return slot->context;
}

std::vector<AdaptationDecision> QualityAdaptationEngine::History(
    const std::string& stream_id) const {
  auto slot = Slot(stream_id);
  if (!slot) return {};
  std::lock_guard<std::mutex> lock(slot->mutex);
  return std::vector<AdaptationDecision>(slot->context.history.begin(),
                                         slot->context.history.end());
}

std::vector<std::string> QualityAdaptationEngine::StreamIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(streams_.size());
  for (const auto& [id, slot] : streams_) ids.push_back(id);
  return ids;
}

AdaptationStatistics QualityAdaptationEngine::Statistics() const {
  AdaptationStatistics stats;
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats = totals_;
    if (totals_.total_decisions > 0) {
      const double n = static_cast<double>(totals_.total_decisions);
      stats.average_confidence = confidence_sum_ / n;
      stats.average_ux_impact = ux_impact_sum_ / n;
    }
  }
  std::lock_guard<std::mutex> lock(mutex_);
  stats.active_streams = streams_.size();
  return stats;
}

}  // namespace streamcore::adaptation
