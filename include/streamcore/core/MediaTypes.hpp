// Repository: streamcore
// Component: Media Types
// Purpose: Value types shared by the buffer, sync, codec and adaptation
//          components.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_CORE_MEDIA_TYPES_HPP_
#define STREAMCORE_CORE_MEDIA_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace streamcore {

enum class MediaKind {
  kAudio = 0,
  kVideo = 1,
  kData = 2,
};

inline const char* MediaKindToString(MediaKind kind) {
  switch (kind) {
    case MediaKind::kAudio: return "audio";
    case MediaKind::kVideo: return "video";
    case MediaKind::kData:  return "data";
  }
  return "unknown";
}

// Parses "audio" / "video" / "data". Returns nullopt for anything else.
std::optional<MediaKind> MediaKindFromString(const std::string& name);

struct Resolution {
  int width = 0;
  int height = 0;

  int64_t Pixels() const { return static_cast<int64_t>(width) * height; }

  // True when both dimensions fit inside other.
  bool FitsWithin(const Resolution& other) const {
    return width <= other.width && height <= other.height;
  }

  bool operator==(const Resolution& other) const {
    return width == other.width && height == other.height;
  }
  bool operator!=(const Resolution& other) const { return !(*this == other); }
};

// Latest transport-side measurement for one stream.
// packet_loss is a fraction in [0,1].
struct NetworkConditions {
  int64_t bandwidth_bps = 0;
  int64_t rtt_ms = 0;
  double packet_loss = 0.0;
  int64_t jitter_ms = 0;
  bool stable = true;
  int64_t sampled_at_ms = 0;
};

}  // namespace streamcore

#endif  // STREAMCORE_CORE_MEDIA_TYPES_HPP_
