// Repository: streamcore
// Component: Buffer Configuration
// Purpose: Watermark derivation and validation.
// Copyright (c) 2025 StreamCore

#include "streamcore/buffer/BufferConfig.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

#include "streamcore/util/Logger.hpp"

namespace streamcore::buffer {

const char* CapacityStrategyToString(CapacityStrategy strategy) {
  switch (strategy) {
    case CapacityStrategy::kFixed:      return "fixed";
    case CapacityStrategy::kAdaptive:   return "adaptive";
    case CapacityStrategy::kPredictive: return "predictive";
  }
  return "unknown";
}

std::optional<CapacityStrategy> CapacityStrategyFromString(const std::string& name) {
  if (name == "fixed") return CapacityStrategy::kFixed;
  if (name == "adaptive") return CapacityStrategy::kAdaptive;
  if (name == "predictive") return CapacityStrategy::kPredictive;
  return std::nullopt;
}

void ValidateWatermarks(size_t capacity, const Watermarks& watermarks) {
  if (watermarks.low < watermarks.high &&
      watermarks.high < watermarks.critical &&
      watermarks.critical <= capacity) {
    return;
  }
  std::ostringstream oss;
  oss << "[BufferPool] INVARIANT_VIOLATION watermarks low=" << watermarks.low
      << " high=" << watermarks.high << " critical=" << watermarks.critical
      << " capacity=" << capacity;
  util::Logger::Error(oss.str());
  throw std::invalid_argument("watermarks must satisfy low < high < critical <= capacity");
}

Watermarks DeriveWatermarks(size_t capacity, const WatermarkFractions& fractions) {
  if (!(fractions.low >= 0.0 && fractions.low < fractions.high &&
        fractions.high < fractions.critical && fractions.critical <= 1.0)) {
    throw std::invalid_argument(
        "watermark fractions must satisfy 0 <= low < high < critical <= 1");
  }
  if (capacity < 3) {
    throw std::invalid_argument("pool capacity must be at least 3 chunks");
  }

  const double cap = static_cast<double>(capacity);
  auto critical = static_cast<size_t>(std::floor(cap * fractions.critical));
  auto high = static_cast<size_t>(std::floor(cap * fractions.high));
  auto low = static_cast<size_t>(std::floor(cap * fractions.low));

  // Rounding can collapse adjacent marks on small pools; pull them apart
  // downwards so critical never exceeds capacity.
  if (critical > capacity) critical = capacity;
  if (critical < 2) critical = 2;
  if (high >= critical) high = critical - 1;
  if (high < 1) high = 1;
  if (low >= high) low = high - 1;

  Watermarks watermarks{low, high, critical};
  ValidateWatermarks(capacity, watermarks);
  return watermarks;
}

}  // namespace streamcore::buffer
