// Repository: streamcore
// Component: Adaptation Types
// Purpose: Per-stream adaptation context, constraints and decisions.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_ADAPTATION_ADAPTATION_TYPES_HPP_
#define STREAMCORE_ADAPTATION_ADAPTATION_TYPES_HPP_

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>

#include "streamcore/codec/CodecTypes.hpp"
#include "streamcore/core/MediaTypes.hpp"

namespace streamcore::adaptation {

enum class AdaptationAction {
  kUpgrade = 0,
  kDowngrade = 1,
  kMaintain = 2,
  kEmergency = 3,
};

const char* AdaptationActionToString(AdaptationAction action);

enum class QualityPriority {
  kBalanced = 0,
  kQuality = 1,
  kBattery = 2,
  kData = 3,
};

const char* QualityPriorityToString(QualityPriority priority);
std::optional<QualityPriority> QualityPriorityFromString(const std::string& name);

enum class AdaptationSpeed {
  kSlow = 0,    // dwell x2
  kMedium = 1,
  kFast = 2,    // dwell x0.5
};

// Fractions in [0,1] for usage and battery.
struct DeviceCapabilities {
  int cpu_cores = 0;
  double cpu_usage = 0.0;
  double memory_usage = 0.0;
  int64_t memory_available_mb = 0;
  Resolution display;  // zero = unknown
  int display_refresh_hz = 0;
  bool hw_video_decode = true;
  double battery_level = 1.0;
  bool charging = true;
  int64_t sampled_at_ms = 0;
};

struct UserPreferences {
  QualityPriority priority = QualityPriority::kBalanced;
  int64_t max_bitrate_bps = 0;  // 0 = no preference
  bool auto_adjust = true;
  std::optional<Resolution> preferred_resolution;
  int64_t latency_tolerance_ms = 0;  // 0 = no preference
  AdaptationSpeed speed = AdaptationSpeed::kMedium;
};

struct SessionMetrics {
  int64_t duration_ms = 0;
  uint64_t total_bytes = 0;
  uint64_t quality_changes = 0;
  double buffer_health = 1.0;  // [0,1]
  double error_rate = 0.0;     // [0,1]
  uint64_t rebuffering_events = 0;
  int64_t average_latency_ms = 0;
};

// Hard limits every decision must satisfy. Zero means unbounded.
struct QualityConstraints {
  int64_t min_bitrate_bps = 0;
  int64_t max_bitrate_bps = 0;
  Resolution min_resolution;
  Resolution max_resolution;
  int min_framerate = 0;
  int max_framerate = 0;
  int64_t latency_budget_ms = 0;
  // Max estimated cpu impact (percent) relative to the lowest rung.
  double power_budget = 0.0;
};

// True when the rung lies inside every bound of the constraints.
bool SatisfiesConstraints(const codec::QualityLevel& level, MediaKind kind,
                          const QualityConstraints& constraints);

struct EstimatedImpact {
  double latency_ms = 0.0;
  double bandwidth_bps = 0.0;
  double cpu = 0.0;
  double battery = 0.0;
  double ux = 0.0;
};

struct DecisionTimeline {
  bool immediate = false;
  int64_t decided_at_ms = 0;
  int64_t transition_ms = 0;
};

struct AdaptationDecision {
  std::string stream_id;
  AdaptationAction action = AdaptationAction::kMaintain;
  std::string reason;
  double confidence = 0.0;  // [0,1]
  codec::QualityLevel new_quality;
  codec::QualityLevel previous_quality;
  EstimatedImpact estimated_impact;
  DecisionTimeline timeline;
  std::optional<codec::QualityLevel> rollback_plan;
  bool forced = false;
};

struct AdaptationContext {
  std::string stream_id;
  MediaKind kind = MediaKind::kVideo;
  codec::QualityLadder ladder;
  size_t current_rung = 0;
  std::optional<size_t> target_rung;

  NetworkConditions network;
  bool has_network_sample = false;
  DeviceCapabilities device;
  bool has_device_sample = false;
  UserPreferences preferences;
  SessionMetrics metrics;
  QualityConstraints constraints;

  bool pending_underrun = false;
  bool pending_desync = false;
  std::string pending_emergency_reason;

  int64_t created_at_ms = 0;
  int64_t last_decision_ms = -1;
  int64_t last_emergency_ms = -1;
  // Rule name -> last time it drove a decision (cooldowns).
  std::map<std::string, int64_t> rule_last_fired;
  std::deque<AdaptationDecision> history;

  const codec::QualityLevel& current() const { return ladder[current_rung]; }
};

struct AdaptationStatistics {
  size_t active_streams = 0;
  uint64_t total_decisions = 0;
  uint64_t emergencies = 0;
  uint64_t forced = 0;
  std::map<std::string, uint64_t> by_action;
  std::map<std::string, uint64_t> by_reason;
  double average_confidence = 0.0;
  double average_ux_impact = 0.0;
};

}  // namespace streamcore::adaptation

#endif  // STREAMCORE_ADAPTATION_ADAPTATION_TYPES_HPP_
