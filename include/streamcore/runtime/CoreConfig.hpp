// Repository: streamcore
// Component: Core Configuration
// Purpose: Aggregated tuning for buffers, sync, adaptation, codecs and event
//          channels, with YAML loading.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_RUNTIME_CORE_CONFIG_HPP_
#define STREAMCORE_RUNTIME_CORE_CONFIG_HPP_

#include <cstddef>
#include <string>

#include "streamcore/adaptation/QualityAdaptationEngine.hpp"
#include "streamcore/buffer/BufferConfig.hpp"
#include "streamcore/codec/CodecRegistry.hpp"
#include "streamcore/timing/SyncCoordinator.hpp"

namespace streamcore::runtime {

struct ChannelConfig {
  // Max queued events per consumer channel before the oldest is dropped.
  size_t capacity = 1024;
};

struct CoreConfig {
  buffer::BufferConfig buffer;
  timing::SyncConfig sync;
  adaptation::AdaptationConfig adaptation;
  codec::CodecConfig codec;
  ChannelConfig channels;

  // Throws std::invalid_argument describing the first bad field.
  void Validate() const;

  // Parses a YAML document. Recognized top-level keys:
  //   capacity_strategy, watermark_fractions {low, high, critical},
  //   sync_tolerance_ms, correction_rate_limit, dwell_time_ms,
  //   ladder_rung_count
  // plus the optional groups buffer:, sync:, adaptation:, channels:.
  // Unknown keys are ignored. Malformed values throw std::invalid_argument.
  // The result is validated before it is returned.
  static CoreConfig FromYaml(const std::string& text);
  static CoreConfig FromYamlFile(const std::string& path);
};

}  // namespace streamcore::runtime

#endif  // STREAMCORE_RUNTIME_CORE_CONFIG_HPP_
