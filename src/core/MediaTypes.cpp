// Repository: streamcore
// Component: Media Types
// Purpose: Parsing helpers for shared value types.
// Copyright (c) 2025 StreamCore

#include "streamcore/core/MediaTypes.hpp"

namespace streamcore {

std::optional<MediaKind> MediaKindFromString(const std::string& name) {
  if (name == "audio") return MediaKind::kAudio;
  if (name == "video") return MediaKind::kVideo;
  if (name == "data") return MediaKind::kData;
  return std::nullopt;
}

}  // namespace streamcore
