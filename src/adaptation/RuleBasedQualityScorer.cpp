// Repository: streamcore
// Component: Rule-Based Quality Scorer
// Purpose: Default weighted rule set for candidate rung selection.
// Copyright (c) 2025 StreamCore

#include "streamcore/adaptation/RuleBasedQualityScorer.hpp"

#include <algorithm>

namespace streamcore::adaptation {

namespace {

constexpr double kConfidenceWithSample = 0.9;
constexpr double kConfidenceWithoutSample = 0.5;
// Estimated cpu cost (percent) per unit of bitrate ratio over the lowest rung.
constexpr double kCpuPerBitrateRatio = 20.0;

// Highest rung index whose bitrate fits under limit; 0 if none does.
size_t HighestRungAtOrBelow(const codec::QualityLadder& ladder, double limit_bps) {
  size_t best = 0;
  for (const auto& level : ladder) {
    if (static_cast<double>(level.bitrate_bps) <= limit_bps) best = level.index;
  }
  return best;
}

size_t HighestRungFitting(const codec::QualityLadder& ladder, const Resolution& bound) {
  size_t best = 0;
  for (const auto& level : ladder) {
    if (level.resolution.FitsWithin(bound)) best = level.index;
  }
  return best;
}

}  // namespace

RuleBasedQualityScorer::RuleBasedQualityScorer(RuleConfig config) : config_(config) {}

bool RuleBasedQualityScorer::InCooldown(const AdaptationContext& context,
                                        const std::string& rule,
                                        int64_t cooldown_ms, int64_t now_ms) const {
  auto it = context.rule_last_fired.find(rule);
  return it != context.rule_last_fired.end() && now_ms - it->second < cooldown_ms;
}

ScoredCandidate RuleBasedQualityScorer::Propose(const AdaptationContext& context,
                                                int64_t now_ms) const {
  const codec::QualityLadder& ladder = context.ladder;
  const size_t top = ladder.size() - 1;
  const size_t current = context.current_rung;
  const size_t stepped_down = current >= config_.degrade_step ? current - config_.degrade_step : 0;

  ScoredCandidate out;
  out.rung = top;
  out.reason = "conditions-stable";
  out.confidence = context.has_network_sample ? kConfidenceWithSample : kConfidenceWithoutSample;

  auto cap = [&out](size_t rung, const char* reason) {
    if (rung < out.rung) {
      out.rung = rung;
      out.reason = reason;
    }
  };
  auto fire = [&](size_t rung, const char* rule) {
    cap(rung, rule);
    out.fired_rules.emplace_back(rule);
  };

  // Bandwidth headroom.
  if (context.has_network_sample) {
    const double usable = static_cast<double>(context.network.bandwidth_bps) *
                          config_.bandwidth_safety_margin;
    const size_t affordable = HighestRungAtOrBelow(ladder, usable);
    if (affordable < current &&
        !InCooldown(context, kRuleBandwidth, config_.bandwidth_cooldown_ms, now_ms)) {
      fire(affordable, kRuleBandwidth);
    } else {
      cap(std::max(affordable, current), "bandwidth-headroom");
    }
  } else {
    cap(current, "no-network-sample");
  }

  // Network quality rules.
  const NetworkConditions& net = context.network;
  if (context.has_network_sample) {
    if (net.packet_loss > config_.packet_loss_threshold &&
        !InCooldown(context, kRulePacketLoss, config_.packet_loss_cooldown_ms, now_ms)) {
      fire(stepped_down, kRulePacketLoss);
    }
    int64_t latency_budget = config_.rtt_threshold_ms;
    if (context.constraints.latency_budget_ms > 0) {
      latency_budget = context.constraints.latency_budget_ms;
    } else if (context.preferences.latency_tolerance_ms > 0) {
      latency_budget = context.preferences.latency_tolerance_ms;
    }
    if (net.rtt_ms > latency_budget &&
        !InCooldown(context, kRuleHighLatency, config_.latency_cooldown_ms, now_ms)) {
      fire(stepped_down, kRuleHighLatency);
    }
  }

  const SessionMetrics& metrics = context.metrics;
  if ((metrics.buffer_health < config_.buffer_health_threshold ||
       metrics.rebuffering_events > config_.rebuffering_threshold) &&
      !InCooldown(context, kRuleBufferHealth, config_.buffer_health_cooldown_ms, now_ms)) {
    fire(stepped_down, kRuleBufferHealth);
  }

  // Device fit.
  if (context.has_device_sample) {
    const DeviceCapabilities& device = context.device;
    if (device.cpu_usage > config_.cpu_threshold) {
      cap(std::min<size_t>(1, top), "device-cpu");
    }
    if (device.memory_usage > config_.memory_threshold && top > 0) {
      cap(top - 1, "device-memory");
    }
    if (context.kind == MediaKind::kVideo && device.display.width > 0) {
      cap(HighestRungFitting(ladder, device.display), "device-display");
    }
    if (device.battery_level < config_.low_battery_threshold && !device.charging) {
      cap(std::min<size_t>(1, top), "low-battery");
    }
  }

  // User priority weighting.
  const UserPreferences& prefs = context.preferences;
  if (prefs.max_bitrate_bps > 0) {
    cap(HighestRungAtOrBelow(ladder, static_cast<double>(prefs.max_bitrate_bps)),
        "user-max-bitrate");
  }
  if (prefs.preferred_resolution && context.kind == MediaKind::kVideo) {
    cap(HighestRungFitting(ladder, *prefs.preferred_resolution), "user-resolution");
  }
  switch (prefs.priority) {
    case QualityPriority::kData:
      cap(top / 2, "data-saver");
      break;
    case QualityPriority::kBattery:
      if (!context.has_device_sample || !context.device.charging) {
        cap(std::min<size_t>(1, top), "battery-saver");
      }
      break;
    case QualityPriority::kQuality:
    case QualityPriority::kBalanced:
      break;
  }

  // Power budget, as estimated cpu cost over the lowest rung.
  if (context.constraints.power_budget > 0.0 && ladder.front().bitrate_bps > 0) {
    const double base = static_cast<double>(ladder.front().bitrate_bps);
    size_t affordable = 0;
    for (const auto& level : ladder) {
      const double cpu = (static_cast<double>(level.bitrate_bps) / base - 1.0) *
                         kCpuPerBitrateRatio;
      if (cpu <= context.constraints.power_budget) affordable = level.index;
    }
    cap(affordable, "power-budget");
  }

  // Upgrades only with real headroom over the current bitrate.
  if (out.rung > current) {
    const double needed = static_cast<double>(ladder[current].bitrate_bps) *
                          config_.upgrade_headroom;
    const bool headroom = context.has_network_sample &&
                          static_cast<double>(net.bandwidth_bps) >= needed;
    if (prefs.auto_adjust && headroom &&
        !InCooldown(context, kRuleUpgrade, config_.upgrade_cooldown_ms, now_ms)) {
      out.reason = kRuleUpgrade;
      out.fired_rules.emplace_back(kRuleUpgrade);
    } else {
      out.rung = current;
      out.reason = "upgrade-gated";
    }
  }

  return out;
}

}  // namespace streamcore::adaptation
