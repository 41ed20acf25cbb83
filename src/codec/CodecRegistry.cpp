// Repository: streamcore
// Component: Codec Registry
// Purpose: Codec catalog, weighted selection and ladder construction.
// Copyright (c) 2025 StreamCore

#include "streamcore/codec/CodecRegistry.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "streamcore/util/Logger.hpp"

namespace streamcore::codec {

namespace {

constexpr size_t kMinRungs = 3;
constexpr size_t kMaxRungs = 6;
constexpr int kLadderMaxFramerate = 30;

struct VideoStep {
  Resolution resolution;
  int64_t nominal_bitrate_bps;
};

// Nominal bitrate per resolution class (240p .. 2160p).
constexpr std::array<VideoStep, 6> kVideoSteps = {{
    {{426, 240}, 500'000},
    {{640, 360}, 750'000},
    {{854, 480}, 1'200'000},
    {{1280, 720}, 2'500'000},
    {{1920, 1080}, 5'000'000},
    {{3840, 2160}, 15'000'000},
}};

constexpr std::array<const char*, 6> kRungNames = {
    "low", "medium", "high", "ultra", "extreme", "max"};

int AudioSampleRateFor(int64_t bitrate_bps) {
  if (bitrate_bps <= 64'000) return 22'050;
  if (bitrate_bps <= 128'000) return 44'100;
  return 48'000;
}

Resolution VideoResolutionFor(int64_t bitrate_bps, const Resolution& codec_max) {
  Resolution chosen = kVideoSteps.front().resolution;
  for (const auto& step : kVideoSteps) {
    if (step.nominal_bitrate_bps > bitrate_bps) break;
    if (codec_max.width > 0 && !step.resolution.FitsWithin(codec_max)) break;
    chosen = step.resolution;
  }
  return chosen;
}

bool SharesContainer(const CodecProfile& a, const CodecProfile& b) {
  for (const auto& container : a.containers) {
    if (std::find(b.containers.begin(), b.containers.end(), container) != b.containers.end()) {
      return true;
    }
  }
  return false;
}

}  // namespace

CodecRegistry::CodecRegistry(CodecConfig config) : config_(std::move(config)) {
  if (config_.ladder_rung_count < kMinRungs || config_.ladder_rung_count > kMaxRungs) {
    util::Logger::Error("[CodecRegistry] INVARIANT_VIOLATION ladder_rung_count=" +
                        std::to_string(config_.ladder_rung_count));
    throw std::invalid_argument("ladder_rung_count must be within [3, 6]");
  }
  if (config_.load_defaults) {
    for (const auto& profile : DefaultProfiles()) {
      profiles_[profile.name] = profile;
    }
  }
}

std::vector<CodecProfile> CodecRegistry::DefaultProfiles() {
  std::vector<CodecProfile> profiles;

  CodecProfile h264;
  h264.name = "H264";
  h264.mime = "video/mp4";
  h264.kind = MediaKind::kVideo;
  h264.capabilities = {true, true, true, {4096, 2160}, 100'000'000, 60};
  h264.priority = 10;
  h264.containers = {"mp4", "webm"};
  h264.low_latency = true;
  profiles.push_back(h264);

  CodecProfile vp9;
  vp9.name = "VP9";
  vp9.mime = "video/webm";
  vp9.kind = MediaKind::kVideo;
  vp9.capabilities = {true, true, true, {8192, 4320}, 200'000'000, 120};
  vp9.priority = 9;
  vp9.containers = {"webm"};
  vp9.bandwidth_efficient = true;
  profiles.push_back(vp9);

  CodecProfile av1;
  av1.name = "AV1";
  av1.mime = "video/mp4";
  av1.kind = MediaKind::kVideo;
  av1.capabilities = {false, true, false, {8192, 4320}, 800'000'000, 120};
  av1.priority = 8;
  av1.containers = {"mp4", "webm"};
  av1.bandwidth_efficient = true;
  profiles.push_back(av1);

  CodecProfile opus;
  opus.name = "Opus";
  opus.mime = "audio/opus";
  opus.kind = MediaKind::kAudio;
  opus.capabilities = {true, true, false, {}, 510'000, 0};
  opus.priority = 10;
  opus.containers = {"webm", "ogg"};
  opus.low_latency = true;
  opus.bandwidth_efficient = true;
  profiles.push_back(opus);

  CodecProfile aac;
  aac.name = "AAC";
  aac.mime = "audio/mp4";
  aac.kind = MediaKind::kAudio;
  aac.capabilities = {true, true, true, {}, 320'000, 0};
  aac.priority = 9;
  aac.containers = {"mp4", "m4a"};
  profiles.push_back(aac);

  return profiles;
}

void CodecRegistry::Register(const CodecProfile& profile) {
  std::lock_guard<std::mutex> lock(mutex_);
  profiles_[profile.name] = profile;
  util::Logger::Debug("[CodecRegistry] REGISTER codec=" + profile.name);
}

bool CodecRegistry::Unregister(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return profiles_.erase(name) > 0;
}

std::optional<CodecProfile> CodecRegistry::Find(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = profiles_.find(name);
  if (it == profiles_.end()) return std::nullopt;
  return it->second;
}

std::vector<CodecProfile> CodecRegistry::Profiles(MediaKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<CodecProfile> result;
  for (const auto& [name, profile] : profiles_) {
    if (profile.kind == kind) result.push_back(profile);
  }
  return result;
}

size_t CodecRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return profiles_.size();
}

bool CodecRegistry::MeetsConstraints(const CodecProfile& profile, MediaKind kind,
                                     const CodecConstraints& constraints) {
  const CodecCapabilities& caps = profile.capabilities;
  if (profile.kind != kind || !caps.decode) return false;
  if (constraints.require_encode && !caps.encode) return false;
  if (constraints.require_hw_accel && !caps.hw_accel) return false;
  if (constraints.max_bitrate_bps > 0 && constraints.max_bitrate_bps > caps.max_bitrate_bps) {
    return false;
  }
  if (kind == MediaKind::kVideo) {
    if (constraints.resolution && !constraints.resolution->FitsWithin(caps.max_resolution)) {
      return false;
    }
    if (constraints.framerate > 0 && constraints.framerate > caps.max_framerate) {
      return false;
    }
  }
  if (!constraints.compatibility.empty() &&
      std::find(constraints.compatibility.begin(), constraints.compatibility.end(),
                profile.name) == constraints.compatibility.end()) {
    return false;
  }
  if (!constraints.container.empty() &&
      std::find(profile.containers.begin(), profile.containers.end(),
                constraints.container) == profile.containers.end()) {
    return false;
  }
  return true;
}

double CodecRegistry::Score(const CodecProfile& profile,
                            const CodecConstraints& constraints) const {
  const CodecScoreWeights& w = config_.weights;
  double score = w.priority * profile.priority;

  const int64_t target = constraints.target_bitrate_bps > 0 ? constraints.target_bitrate_bps
                                                            : constraints.max_bitrate_bps;
  if (target > 0 && profile.capabilities.max_bitrate_bps > 0) {
    const double cap = static_cast<double>(profile.capabilities.max_bitrate_bps);
    const double t = static_cast<double>(target);
    score += w.bitrate_fit * (1.0 - std::abs(cap - t) / std::max(cap, t));
  }

  if (constraints.prefer_hw_accel && profile.capabilities.hw_accel) {
    score += w.hw_accel_bonus;
  }

  const auto& compat = constraints.compatibility;
  auto rank = std::find(compat.begin(), compat.end(), profile.name);
  if (rank != compat.end()) {
    const double n = static_cast<double>(compat.size());
    score += w.compatibility_rank * (n - static_cast<double>(rank - compat.begin())) / n;
  }

  if (constraints.low_latency && profile.low_latency) {
    score += w.low_latency_bonus;
  }
  if (constraints.bandwidth_constrained && profile.bandwidth_efficient) {
    score += w.bandwidth_bonus;
  }
  return score;
}

std::optional<CodecProfile> CodecRegistry::Select(MediaKind kind,
                                                  const CodecConstraints& constraints) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto selected = SelectLocked(kind, constraints);
  if (!selected) {
    util::Logger::Warn(std::string("[CodecRegistry] NO_MATCH kind=") +
                       MediaKindToString(kind) +
                       " max_bitrate=" + std::to_string(constraints.max_bitrate_bps));
  }
  return selected;
}

std::optional<CodecProfile> CodecRegistry::SelectLocked(
    MediaKind kind, const CodecConstraints& constraints) const {
  const CodecProfile* best = nullptr;
  double best_score = 0.0;
  for (const auto& [name, profile] : profiles_) {
    if (!MeetsConstraints(profile, kind, constraints)) continue;
    const double score = Score(profile, constraints);
    if (best == nullptr || score > best_score ||
        (score == best_score && profile.priority > best->priority)) {
      best = &profile;
      best_score = score;
    }
  }
  if (best == nullptr) return std::nullopt;
  return *best;
}

QualityLadder CodecRegistry::BuildLadder(const std::string& base_codec,
                                         int64_t max_bitrate_bps) const {
  std::lock_guard<std::mutex> lock(mutex_);
  QualityLadder ladder;

  auto base_it = profiles_.find(base_codec);
  if (base_it == profiles_.end()) {
    util::Logger::Warn("[CodecRegistry] LADDER_REJECTED unknown codec=" + base_codec);
    return ladder;
  }
  const CodecProfile& base = base_it->second;

  int64_t bound = max_bitrate_bps;
  if (base.capabilities.max_bitrate_bps > 0) {
    bound = std::min(bound, base.capabilities.max_bitrate_bps);
  }
  const size_t rungs = config_.ladder_rung_count;
  if (bound < static_cast<int64_t>(rungs)) {
    return ladder;
  }

  std::vector<std::string> compatibility{base.name};
  for (const auto& [name, profile] : profiles_) {
    if (name != base.name && profile.kind == base.kind && SharesContainer(base, profile)) {
      compatibility.push_back(name);
    }
  }

  const int framerate = base.capabilities.max_framerate > 0
      ? std::min(kLadderMaxFramerate, base.capabilities.max_framerate)
      : kLadderMaxFramerate;

  for (size_t i = 0; i < rungs; ++i) {
    QualityLevel level;
    level.index = i;
    level.name = kRungNames[i];
    level.bitrate_bps = bound * static_cast<int64_t>(i + 1) / static_cast<int64_t>(rungs);

    CodecConstraints constraints;
    constraints.max_bitrate_bps = level.bitrate_bps;
    constraints.compatibility = compatibility;
    constraints.prefer_hw_accel = base.capabilities.hw_accel;

    if (base.kind == MediaKind::kVideo) {
      level.resolution = VideoResolutionFor(level.bitrate_bps, base.capabilities.max_resolution);
      level.framerate = framerate;
      constraints.resolution = level.resolution;
      constraints.framerate = level.framerate;
    } else if (base.kind == MediaKind::kAudio) {
      level.sample_rate = AudioSampleRateFor(level.bitrate_bps);
    }

    auto selected = SelectLocked(base.kind, constraints);
    level.codec = selected ? selected->name : base.name;
    ladder.push_back(level);
  }

  for (size_t i = 1; i < ladder.size(); ++i) {
    if (ladder[i].bitrate_bps <= ladder[i - 1].bitrate_bps ||
        ladder[i].resolution.Pixels() < ladder[i - 1].resolution.Pixels()) {
      util::Logger::Error("[CodecRegistry] INVARIANT_VIOLATION ladder not monotonic codec=" +
                          base_codec);
      throw std::logic_error("quality ladder must be monotonically increasing");
    }
  }

  std::ostringstream oss;
  oss << "[CodecRegistry] LADDER codec=" << base_codec << " rungs=" << ladder.size()
      << " bitrates=";
  for (const auto& level : ladder) oss << level.bitrate_bps << ",";
  util::Logger::Debug(oss.str());
  return ladder;
}

}  // namespace streamcore::codec
