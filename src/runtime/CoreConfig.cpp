// Repository: streamcore
// Component: Core Configuration
// Purpose: Validation and yaml-cpp loading for CoreConfig.
// Copyright (c) 2025 StreamCore

#include "streamcore/runtime/CoreConfig.hpp"

#include <cstdint>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

#include "streamcore/util/Logger.hpp"

namespace streamcore::runtime {

namespace {

[[noreturn]] void Fail(const std::string& what) {
  util::Logger::Error("[CoreConfig] INVARIANT_VIOLATION " + what);
  throw std::invalid_argument(what);
}

// Assigns node[key] to out when present; conversion errors become
// std::invalid_argument naming the key.
template <typename T>
void Read(const YAML::Node& node, const char* key, T& out) {
  const YAML::Node value = node[key];
  if (!value) return;
  try {
    out = value.as<T>();
  } catch (const YAML::Exception& e) {
    Fail(std::string("malformed value for '") + key + "': " + e.what());
  }
}

void ReadSize(const YAML::Node& node, const char* key, size_t& out) {
  int64_t value = static_cast<int64_t>(out);
  Read(node, key, value);
  if (value < 0) Fail(std::string("'") + key + "' must not be negative");
  out = static_cast<size_t>(value);
}

void ReadStrategy(const YAML::Node& node, buffer::BufferConfig& buffer) {
  std::string name;
  Read(node, "capacity_strategy", name);
  if (name.empty()) return;
  const auto strategy = buffer::CapacityStrategyFromString(name);
  if (!strategy) Fail("unknown capacity_strategy '" + name + "'");
  buffer.capacity_strategy = *strategy;
}

void ReadFractions(const YAML::Node& node, buffer::WatermarkFractions& fractions) {
  const YAML::Node wm = node["watermark_fractions"];
  if (!wm) return;
  if (!wm.IsMap()) Fail("watermark_fractions must be a map of low/high/critical");
  Read(wm, "low", fractions.low);
  Read(wm, "high", fractions.high);
  Read(wm, "critical", fractions.critical);
}

void ReadBuffer(const YAML::Node& n, buffer::BufferConfig& c) {
  ReadStrategy(n, c);
  ReadFractions(n, c.watermark_fractions);
  ReadSize(n, "base_capacity_chunks", c.base_capacity_chunks);
  Read(n, "video_capacity_factor", c.video_capacity_factor);
  Read(n, "data_capacity_factor", c.data_capacity_factor);
  Read(n, "underrun_grace_ms", c.underrun_grace_ms);
  Read(n, "dependency_timeout_ms", c.dependency_timeout_ms);
  if (n["eviction_weights"]) {
    const YAML::Node w = n["eviction_weights"];
    Read(w, "age", c.eviction_weights.age_weight);
    Read(w, "priority", c.eviction_weights.priority_weight);
    Read(w, "dependency", c.eviction_weights.dependency_weight);
  }
}

void ReadSync(const YAML::Node& n, timing::SyncConfig& c) {
  Read(n, "sync_tolerance_ms", c.sync_tolerance_ms);
  Read(n, "correction_window_ms", c.correction_window_ms);
  Read(n, "correction_rate_limit", c.correction_rate_limit);
  Read(n, "max_rate_deviation", c.max_rate_deviation);
  Read(n, "reconcile_interval_ms", c.reconcile_interval_ms);
  Read(n, "sync_point_ttl_ms", c.sync_point_ttl_ms);
}

void ReadAdaptation(const YAML::Node& n, adaptation::AdaptationConfig& c) {
  Read(n, "dwell_time_ms", c.dwell_time_ms);
  ReadSize(n, "hysteresis_rungs", c.hysteresis_rungs);
  Read(n, "evaluation_interval_ms", c.evaluation_interval_ms);
  ReadSize(n, "history_limit", c.history_limit);
  Read(n, "bandwidth_safety_margin", c.rules.bandwidth_safety_margin);
  ReadSize(n, "degrade_step", c.rules.degrade_step);
}

}  // namespace

void CoreConfig::Validate() const {
  const buffer::WatermarkFractions& f = buffer.watermark_fractions;
  if (!(f.low >= 0.0 && f.low < f.high && f.high < f.critical && f.critical <= 1.0)) {
    Fail("watermark_fractions must satisfy 0 <= low < high < critical <= 1");
  }
  if (buffer.base_capacity_chunks < 3) Fail("base_capacity_chunks must be at least 3");
  if (buffer.video_capacity_factor <= 0.0 || buffer.data_capacity_factor <= 0.0) {
    Fail("capacity factors must be positive");
  }
  if (buffer.underrun_grace_ms < 0 || buffer.dependency_timeout_ms < 0) {
    Fail("buffer timeouts must not be negative");
  }
  if (sync.sync_tolerance_ms < 0) Fail("sync_tolerance_ms must not be negative");
  if (sync.correction_window_ms <= sync.sync_tolerance_ms) {
    Fail("correction_window_ms must exceed sync_tolerance_ms");
  }
  if (sync.correction_rate_limit <= 0.0 || sync.correction_rate_limit > 1.0) {
    Fail("correction_rate_limit must be in (0, 1]");
  }
  if (sync.max_rate_deviation <= 0.0) Fail("max_rate_deviation must be positive");
  if (sync.reconcile_interval_ms <= 0) Fail("reconcile_interval_ms must be positive");
  if (adaptation.dwell_time_ms < 0) Fail("dwell_time_ms must not be negative");
  if (adaptation.evaluation_interval_ms <= 0) Fail("evaluation_interval_ms must be positive");
  if (adaptation.history_limit == 0) Fail("history_limit must be positive");
  if (adaptation.rules.bandwidth_safety_margin <= 0.0 ||
      adaptation.rules.bandwidth_safety_margin > 1.0) {
    Fail("bandwidth_safety_margin must be in (0, 1]");
  }
  if (codec.ladder_rung_count < 3 || codec.ladder_rung_count > 6) {
    Fail("ladder_rung_count must be within [3, 6]");
  }
  if (channels.capacity == 0) Fail("channel capacity must be positive");
}

CoreConfig CoreConfig::FromYaml(const std::string& text) {
  YAML::Node y;
  try {
    y = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    Fail(std::string("unparseable YAML: ") + e.what());
  }

  CoreConfig c{};
  if (y.IsNull()) {
    c.Validate();
    return c;
  }
  if (!y.IsMap()) Fail("configuration root must be a map");

  // Flat option names first, then the grouped forms.
  ReadStrategy(y, c.buffer);
  ReadFractions(y, c.buffer.watermark_fractions);
  Read(y, "sync_tolerance_ms", c.sync.sync_tolerance_ms);
  Read(y, "correction_rate_limit", c.sync.correction_rate_limit);
  Read(y, "dwell_time_ms", c.adaptation.dwell_time_ms);
  ReadSize(y, "ladder_rung_count", c.codec.ladder_rung_count);

  if (y["buffer"]) ReadBuffer(y["buffer"], c.buffer);
  if (y["sync"]) ReadSync(y["sync"], c.sync);
  if (y["adaptation"]) ReadAdaptation(y["adaptation"], c.adaptation);
  if (y["channels"]) ReadSize(y["channels"], "capacity", c.channels.capacity);

  c.Validate();
  return c;
}

CoreConfig CoreConfig::FromYamlFile(const std::string& path) {
  YAML::Node y;
  try {
    y = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    Fail("cannot load " + path + ": " + e.what());
  }
  return FromYaml(YAML::Dump(y));
}

}  // namespace streamcore::runtime
