// Repository: streamcore
// Component: Codec Types
// Purpose: Codec profiles, selection constraints and ladder rungs.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_CODEC_CODEC_TYPES_HPP_
#define STREAMCORE_CODEC_CODEC_TYPES_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "streamcore/core/MediaTypes.hpp"

namespace streamcore::codec {

struct CodecCapabilities {
  bool encode = true;
  bool decode = true;
  bool hw_accel = false;
  Resolution max_resolution;  // zero for audio/data codecs
  int64_t max_bitrate_bps = 0;
  int max_framerate = 0;
};

struct CodecProfile {
  std::string name;
  std::string mime;
  MediaKind kind = MediaKind::kVideo;
  CodecCapabilities capabilities;
  int priority = 0;
  std::vector<std::string> containers;
  bool low_latency = false;
  bool bandwidth_efficient = false;
};

// What a stream needs from a codec. max_bitrate_bps, resolution and
// framerate are requirements the profile's capabilities must cover.
struct CodecConstraints {
  std::optional<Resolution> resolution;
  int64_t max_bitrate_bps = 0;
  int framerate = 0;
  // Bitrate the stream will actually run at; 0 = max_bitrate_bps.
  int64_t target_bitrate_bps = 0;
  bool prefer_hw_accel = false;
  bool require_hw_accel = false;
  bool require_encode = true;
  bool low_latency = false;
  bool bandwidth_constrained = false;
  // Ordered preference; empty = any codec. Profiles not listed fail.
  std::vector<std::string> compatibility;
  // Required container; empty = any.
  std::string container;
};

struct CodecScoreWeights {
  double bitrate_fit = 10.0;
  double hw_accel_bonus = 5.0;
  double priority = 1.0;
  double compatibility_rank = 3.0;
  double low_latency_bonus = 3.0;
  double bandwidth_bonus = 4.0;
};

// One rung of an adaptive-bitrate ladder. Index 0 is the lowest quality.
struct QualityLevel {
  size_t index = 0;
  std::string name;
  std::string codec;
  int64_t bitrate_bps = 0;
  Resolution resolution;
  int framerate = 0;
  int sample_rate = 0;
};

using QualityLadder = std::vector<QualityLevel>;

struct FormatInfo {
  std::string format;
  std::string codec;
  std::map<std::string, std::string> metadata;
};

}  // namespace streamcore::codec

#endif  // STREAMCORE_CODEC_CODEC_TYPES_HPP_
