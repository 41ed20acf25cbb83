// Repository: streamcore
// Component: Buffer Configuration
// Purpose: Capacity, watermark and eviction tuning for BufferPools.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_BUFFER_BUFFER_CONFIG_HPP_
#define STREAMCORE_BUFFER_BUFFER_CONFIG_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace streamcore::buffer {

enum class CapacityStrategy {
  kFixed = 0,
  kAdaptive = 1,
  kPredictive = 2,
};

const char* CapacityStrategyToString(CapacityStrategy strategy);
std::optional<CapacityStrategy> CapacityStrategyFromString(const std::string& name);

// Fractions of capacity. Must satisfy 0 <= low < high < critical <= 1.
struct WatermarkFractions {
  double low = 0.25;
  double high = 0.75;
  double critical = 0.95;
};

// Absolute watermarks in chunks.
// Invariant: low < high < critical <= capacity.
struct Watermarks {
  size_t low = 0;
  size_t high = 0;
  size_t critical = 0;
};

// Weights of the eviction ordering. A chunk's eviction score is
//   age * age_weight - priority * priority_weight - has_dependents * dependency_weight
// where age is normalized to [0,1] across the pool (1 = oldest timestamp).
// The highest score goes first; chunks that other buffered chunks depend on
// are only considered once every independent chunk is gone.
struct EvictionWeights {
  double age_weight = 1.0;
  double priority_weight = 0.1;
  double dependency_weight = 1.0;
};

struct BufferConfig {
  CapacityStrategy capacity_strategy = CapacityStrategy::kAdaptive;

  // Base capacity for audio pools, in chunks.
  size_t base_capacity_chunks = 64;

  // Video pools are base * video_capacity_factor, data pools base * data_capacity_factor.
  double video_capacity_factor = 4.0;
  double data_capacity_factor = 0.5;

  double fixed_factor = 1.0;
  double adaptive_factor = 1.5;
  double predictive_factor = 2.0;

  // Target latency scaling: below low_latency_ms halves capacity, above
  // high_latency_ms doubles it. 0 target latency means "unspecified".
  int64_t low_latency_ms = 100;
  int64_t high_latency_ms = 500;

  WatermarkFractions watermark_fractions;
  EvictionWeights eviction_weights;

  // How long NextChunk may keep failing below the low watermark before an
  // underrun is raised.
  int64_t underrun_grace_ms = 200;

  // How long the head chunk may wait for a dependency that never arrived.
  int64_t dependency_timeout_ms = 500;
};

// Derives absolute watermarks from fractions.
// Throws std::invalid_argument when the fractions are out of order or the
// capacity is too small to hold three distinct watermarks.
Watermarks DeriveWatermarks(size_t capacity, const WatermarkFractions& fractions);

// Throws std::invalid_argument unless low < high < critical <= capacity.
void ValidateWatermarks(size_t capacity, const Watermarks& watermarks);

}  // namespace streamcore::buffer

#endif  // STREAMCORE_BUFFER_BUFFER_CONFIG_HPP_
