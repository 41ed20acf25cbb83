// Repository: streamcore
// Component: Codec Registry
// Purpose: Catalog of codec profiles; constraint filtering, weighted
//          selection and adaptive-bitrate ladder construction.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_CODEC_CODEC_REGISTRY_HPP_
#define STREAMCORE_CODEC_CODEC_REGISTRY_HPP_

#include <map>
#include <optional>
#include <mutex>
#include <string>
#include <vector>

#include "streamcore/codec/CodecTypes.hpp"

namespace streamcore::codec {

struct CodecConfig {
  // Rungs per ladder; must be within [3, 6].
  size_t ladder_rung_count = 4;
  CodecScoreWeights weights;
  // Populate the registry with the built-in catalog at construction.
  bool load_defaults = true;
};

// Read-mostly after startup registration. All access is serialized by
// mutex_, so re-registering a profile never races a selection.
class CodecRegistry {
 public:
  // Throws std::invalid_argument if ladder_rung_count is outside [3, 6].
  explicit CodecRegistry(CodecConfig config = CodecConfig{});

  CodecRegistry(const CodecRegistry&) = delete;
  CodecRegistry& operator=(const CodecRegistry&) = delete;

  // Idempotent upsert by name.
  void Register(const CodecProfile& profile);
  bool Unregister(const std::string& name);

  std::optional<CodecProfile> Find(const std::string& name) const;
  std::vector<CodecProfile> Profiles(MediaKind kind) const;
  size_t Size() const;

  static bool MeetsConstraints(const CodecProfile& profile, MediaKind kind,
                               const CodecConstraints& constraints);

  double Score(const CodecProfile& profile, const CodecConstraints& constraints) const;

  // Highest-scoring profile that meets the constraints; ties go to registry
  // priority, then name.
  std::optional<CodecProfile> Select(MediaKind kind, const CodecConstraints& constraints) const;

  // Strictly increasing bitrates bounded by min(max_bitrate_bps, the base
  // codec's max bitrate), non-decreasing resolution. Empty when the base
  // codec is unknown or the bound is too small for the rung count.
  QualityLadder BuildLadder(const std::string& base_codec, int64_t max_bitrate_bps) const;

  // H264, VP9, AV1, Opus, AAC.
  static std::vector<CodecProfile> DefaultProfiles();

  const CodecConfig& config() const { return config_; }

 private:
  std::optional<CodecProfile> SelectLocked(MediaKind kind,
                                           const CodecConstraints& constraints) const;

  const CodecConfig config_;
  mutable std::mutex mutex_;
  std::map<std::string, CodecProfile> profiles_;
};

}  // namespace streamcore::codec

#endif  // STREAMCORE_CODEC_CODEC_REGISTRY_HPP_
