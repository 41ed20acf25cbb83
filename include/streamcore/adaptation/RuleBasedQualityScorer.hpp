// Repository: streamcore
// Component: Rule-Based Quality Scorer
// Purpose: Default IQualityScorer. Caps the candidate rung by bandwidth
//          headroom, network rules, device fit, user priority and power
//          budget; gates upgrades behind bandwidth headroom.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_ADAPTATION_RULE_BASED_QUALITY_SCORER_HPP_
#define STREAMCORE_ADAPTATION_RULE_BASED_QUALITY_SCORER_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

#include "streamcore/adaptation/IQualityScorer.hpp"

namespace streamcore::adaptation {

// Rule names, also used as decision reasons and cooldown keys.
inline constexpr const char* kRuleBandwidth = "bandwidth-drop";
inline constexpr const char* kRulePacketLoss = "packet-loss";
inline constexpr const char* kRuleHighLatency = "high-latency";
inline constexpr const char* kRuleBufferHealth = "buffer-health";
inline constexpr const char* kRuleUpgrade = "upgrade-opportunity";

struct RuleConfig {
  // Share of measured bandwidth a rung may consume.
  double bandwidth_safety_margin = 0.8;
  double packet_loss_threshold = 0.05;
  int64_t rtt_threshold_ms = 300;
  double buffer_health_threshold = 0.3;
  uint64_t rebuffering_threshold = 3;
  double cpu_threshold = 0.8;
  double memory_threshold = 0.8;
  double low_battery_threshold = 0.2;
  // Upgrades need bandwidth >= headroom * current bitrate.
  double upgrade_headroom = 1.5;
  // Rungs dropped by the packet-loss, latency and buffer rules. Kept above
  // the hysteresis dead zone so those rules can act.
  size_t degrade_step = 2;

  int64_t packet_loss_cooldown_ms = 5'000;
  int64_t bandwidth_cooldown_ms = 3'000;
  int64_t latency_cooldown_ms = 5'000;
  int64_t buffer_health_cooldown_ms = 2'000;
  int64_t upgrade_cooldown_ms = 10'000;
};

class RuleBasedQualityScorer : public IQualityScorer {
 public:
  explicit RuleBasedQualityScorer(RuleConfig config = RuleConfig{});

  ScoredCandidate Propose(const AdaptationContext& context, int64_t now_ms) const override;

  const char* Name() const override { return "rule-based"; }

  const RuleConfig& config() const { return config_; }

 private:
  bool InCooldown(const AdaptationContext& context, const std::string& rule,
                  int64_t cooldown_ms, int64_t now_ms) const;

  RuleConfig config_;
};

}  // namespace streamcore::adaptation

#endif  // STREAMCORE_ADAPTATION_RULE_BASED_QUALITY_SCORER_HPP_
