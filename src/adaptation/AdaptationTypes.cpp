// Repository: streamcore
// Component: Adaptation Types
// Purpose: String helpers and constraint checks for adaptation values.
// Copyright (c) 2025 StreamCore

#include "streamcore/adaptation/AdaptationTypes.hpp"

namespace streamcore::adaptation {

const char* AdaptationActionToString(AdaptationAction action) {
  switch (action) {
    case AdaptationAction::kUpgrade:   return "upgrade";
    case AdaptationAction::kDowngrade: return "downgrade";
    case AdaptationAction::kMaintain:  return "maintain";
    case AdaptationAction::kEmergency: return "emergency";
  }
  return "unknown";
}

const char* QualityPriorityToString(QualityPriority priority) {
  switch (priority) {
    case QualityPriority::kBalanced: return "balanced";
    case QualityPriority::kQuality:  return "quality";
    case QualityPriority::kBattery:  return "battery";
    case QualityPriority::kData:     return "data";
  }
  return "unknown";
}

std::optional<QualityPriority> QualityPriorityFromString(const std::string& name) {
  if (name == "balanced") return QualityPriority::kBalanced;
  if (name == "quality") return QualityPriority::kQuality;
  if (name == "battery") return QualityPriority::kBattery;
  if (name == "data") return QualityPriority::kData;
  return std::nullopt;
}

bool SatisfiesConstraints(const codec::QualityLevel& level, MediaKind kind,
                          const QualityConstraints& constraints) {
  if (constraints.min_bitrate_bps > 0 && level.bitrate_bps < constraints.min_bitrate_bps) {
    return false;
  }
  if (constraints.max_bitrate_bps > 0 && level.bitrate_bps > constraints.max_bitrate_bps) {
    return false;
  }
  if (kind != MediaKind::kVideo) return true;

  // Resolution and framerate only bind video rungs.
  if (constraints.min_resolution.width > 0 &&
      !constraints.min_resolution.FitsWithin(level.resolution)) {
    return false;
  }
  if (constraints.max_resolution.width > 0 &&
      !level.resolution.FitsWithin(constraints.max_resolution)) {
    return false;
  }
  if (constraints.min_framerate > 0 && level.framerate < constraints.min_framerate) {
    return false;
  }
  if (constraints.max_framerate > 0 && level.framerate > constraints.max_framerate) {
    return false;
  }
  return true;
}

}  // namespace streamcore::adaptation
