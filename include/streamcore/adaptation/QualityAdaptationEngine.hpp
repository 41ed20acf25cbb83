// Repository: streamcore
// Component: Quality Adaptation Engine
// Purpose: Per-stream adaptation contexts; turns network, device, buffer and
//          sync signals into totally ordered adaptation decisions.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_ADAPTATION_QUALITY_ADAPTATION_ENGINE_HPP_
#define STREAMCORE_ADAPTATION_QUALITY_ADAPTATION_ENGINE_HPP_

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "streamcore/adaptation/AdaptationTypes.hpp"
#include "streamcore/adaptation/IQualityScorer.hpp"
#include "streamcore/adaptation/RuleBasedQualityScorer.hpp"
#include "streamcore/codec/CodecTypes.hpp"
#include "streamcore/timing/MasterClock.h"

namespace streamcore::adaptation {

struct AdaptationConfig {
  // Minimum age of the previous decision before a normal one may follow.
  int64_t dwell_time_ms = 5'000;
  // A candidate must differ from the current rung by more than this.
  size_t hysteresis_rungs = 1;
  int64_t evaluation_interval_ms = 5'000;
  size_t history_limit = 100;
  // Network sample age at which confidence starts to decay / bottoms out.
  int64_t sample_fresh_ms = 1'000;
  int64_t sample_stale_ms = 10'000;
  RuleConfig rules;
};

enum class StartStreamResult {
  kStarted,
  kAlreadyExists,
  kEmptyLadder,
  kNoValidRung,  // no rung satisfies the constraints
};

const char* StartStreamResultToString(StartStreamResult result);

enum class ForceResult {
  kApplied,
  kUnknownStream,
  kUnknownQuality,
  kConstraintViolation,
  kPreemptedByEmergency,
};

const char* ForceResultToString(ForceResult result);

struct ForceOutcome {
  ForceResult result = ForceResult::kUnknownStream;
  std::optional<AdaptationDecision> decision;
};

// QualityAdaptationEngine owns one AdaptationContext per stream. Each
// context has its own mutex, so decisions for one stream are totally
// ordered while different streams evaluate independently.
//
// Evaluate():
//   1. pending underrun/desync/emergency signals, or bandwidth below the
//      lowest valid rung, short-circuit to an immediate kEmergency decision
//      at the lowest rung that satisfies the constraints;
//   2. otherwise the scorer proposes a rung;
//   3. the proposal is ignored unless it differs from the current rung by
//      more than hysteresis_rungs and the previous decision is older than
//      the dwell time;
//   4. the survivor is clamped to the nearest rung satisfying constraints.
class QualityAdaptationEngine {
 public:
  // Throws std::invalid_argument if clock is null. A null scorer selects
  // the RuleBasedQualityScorer.
  QualityAdaptationEngine(std::shared_ptr<timing::MasterClock> clock,
                          AdaptationConfig config,
                          std::unique_ptr<IQualityScorer> scorer = nullptr);

  QualityAdaptationEngine(const QualityAdaptationEngine&) = delete;
  QualityAdaptationEngine& operator=(const QualityAdaptationEngine&) = delete;

  StartStreamResult AddStream(const std::string& stream_id, MediaKind kind,
                              codec::QualityLadder ladder,
                              const UserPreferences& preferences,
                              const QualityConstraints& constraints);
  bool RemoveStream(const std::string& stream_id);
  bool HasStream(const std::string& stream_id) const;

  bool UpdateNetworkConditions(const std::string& stream_id, NetworkConditions conditions);
  bool UpdateDeviceCapabilities(const std::string& stream_id, DeviceCapabilities capabilities);
  bool UpdateSessionMetrics(const std::string& stream_id, const SessionMetrics& metrics);

  // Signals consumed by the next Evaluate.
  bool SignalUnderrun(const std::string& stream_id);
  bool SignalDesync(const std::string& stream_id);
  bool SignalEmergency(const std::string& stream_id, const std::string& reason);

  // nullopt only for unknown streams.
  std::optional<AdaptationDecision> Evaluate(const std::string& stream_id);

  // Bypasses scoring and hysteresis but not constraint validation; an
  // invalid target fails instead of being clamped. Pending or recent
  // emergencies always win.
  ForceOutcome ForceQualityChange(const std::string& stream_id,
                                  const std::string& target_quality,
                                  const std::string& reason);

  static bool ShouldConsiderAdaptation(const AdaptationContext& context,
                                       const RuleConfig& rules);

  std::optional<AdaptationContext> Context(const std::string& stream_id) const;
  std::vector<AdaptationDecision> History(const std::string& stream_id) const;
  std::vector<std::string> StreamIds() const;
  AdaptationStatistics Statistics() const;

  const AdaptationConfig& config() const { return config_; }
  const IQualityScorer& scorer() const { return *scorer_; }

 private:
  struct StreamSlot {
    std::mutex mutex;
    AdaptationContext context;
    bool removed = false;
  };

  std::shared_ptr<StreamSlot> Slot(const std::string& stream_id) const;

  std::optional<size_t> LowestValidRung(const AdaptationContext& context) const;
  size_t NearestValidRung(const AdaptationContext& context, size_t rung) const;
  int64_t EffectiveDwellMs(const AdaptationContext& context) const;
  double SampleFreshness(const AdaptationContext& context, int64_t now_ms) const;
  static EstimatedImpact EstimateImpact(const codec::QualityLevel& from,
                                        const codec::QualityLevel& to);

  AdaptationDecision MakeDecision(const AdaptationContext& context, AdaptationAction action,
                                  size_t rung, std::string reason, double confidence,
                                  int64_t now_ms, bool immediate) const;
  void Commit(AdaptationContext& context, const AdaptationDecision& decision, int64_t now_ms);

  std::shared_ptr<timing::MasterClock> clock_;
  const AdaptationConfig config_;
  std::unique_ptr<IQualityScorer> scorer_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<StreamSlot>> streams_;

  // Totals survive RemoveStream.
  mutable std::mutex stats_mutex_;
  AdaptationStatistics totals_;
  double confidence_sum_ = 0.0;
  double ux_impact_sum_ = 0.0;
};

}  // namespace streamcore::adaptation

#endif  // STREAMCORE_ADAPTATION_QUALITY_ADAPTATION_ENGINE_HPP_
