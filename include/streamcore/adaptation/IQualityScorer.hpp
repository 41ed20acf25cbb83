// Repository: streamcore
// Component: Quality Scorer Interface
// Purpose: Pluggable strategy that proposes a ladder rung for a stream.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_ADAPTATION_I_QUALITY_SCORER_HPP_
#define STREAMCORE_ADAPTATION_I_QUALITY_SCORER_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "streamcore/adaptation/AdaptationTypes.hpp"

namespace streamcore::adaptation {

struct ScoredCandidate {
  size_t rung = 0;
  std::string reason;
  double confidence = 0.0;
  // Rules that shaped the candidate; the engine stamps their cooldowns only
  // when the candidate is acted on.
  std::vector<std::string> fired_rules;
};

// IQualityScorer proposes a target rung from the context. It must not
// mutate engine state; hysteresis and constraint clamping happen after it.
class IQualityScorer {
 public:
  virtual ~IQualityScorer() = default;

  virtual ScoredCandidate Propose(const AdaptationContext& context, int64_t now_ms) const = 0;

  virtual const char* Name() const = 0;
};

}  // namespace streamcore::adaptation

#endif  // STREAMCORE_ADAPTATION_I_QUALITY_SCORER_HPP_
