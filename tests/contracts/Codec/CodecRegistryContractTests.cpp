// Repository: streamcore
// Component: CodecRegistry Contract Tests
// Purpose: Constraint filtering, weighted selection, upsert semantics and
//          quality ladder construction.
// Copyright (c) 2025 StreamCore

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <stdexcept>

#include "streamcore/codec/CodecRegistry.hpp"

using namespace streamcore;
using namespace streamcore::codec;
using namespace streamcore::tests;

namespace {

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage(
      "Codec", {"CODEC-001", "CODEC-002", "CODEC-003", "CODEC-004", "CODEC-005"});
  return true;
}();

CodecProfile VideoProfile(const std::string& name, int64_t max_bitrate_bps, bool hw_accel) {
  CodecProfile profile;
  profile.name = name;
  profile.mime = "video/mp4";
  profile.kind = MediaKind::kVideo;
  profile.capabilities.hw_accel = hw_accel;
  profile.capabilities.max_resolution = Resolution{1920, 1080};
  profile.capabilities.max_bitrate_bps = max_bitrate_bps;
  profile.capabilities.max_framerate = 60;
  profile.priority = 5;
  profile.containers = {"mp4"};
  return profile;
}

class CodecRegistryContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "Codec"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"CODEC-001", "CODEC-002", "CODEC-003", "CODEC-004", "CODEC-005"};
  }

  CodecRegistry registry_;
};

// Rule: CODEC-001 Only profiles meeting every constraint are selectable.
TEST_F(CodecRegistryContractTest, CODEC_001_SelectionHonorsBitrateRequirement) {
  CodecConfig config;
  config.load_defaults = false;
  CodecRegistry registry(config);
  registry.Register(VideoProfile("soft3m", 3'000'000, false));
  registry.Register(VideoProfile("hw1m5", 1'500'000, true));

  CodecConstraints constraints;
  constraints.max_bitrate_bps = 2'000'000;
  constraints.prefer_hw_accel = true;
  auto selected = registry.Select(MediaKind::kVideo, constraints);
  ASSERT_TRUE(selected.has_value());
  EXPECT_EQ(selected->name, "soft3m");

  constraints.require_hw_accel = true;
  EXPECT_FALSE(registry.Select(MediaKind::kVideo, constraints).has_value());
  EXPECT_FALSE(registry.Select(MediaKind::kAudio, CodecConstraints{}).has_value());
}

// Rule: CODEC-001 Resolution, framerate, container and compatibility all filter.
TEST_F(CodecRegistryContractTest, CODEC_001_MeetsConstraints) {
  const auto h264 = registry_.Find("H264");
  const auto av1 = registry_.Find("AV1");
  const auto opus = registry_.Find("Opus");
  ASSERT_TRUE(h264 && av1 && opus);

  CodecConstraints uhd;
  uhd.resolution = Resolution{7680, 4320};
  EXPECT_FALSE(CodecRegistry::MeetsConstraints(*h264, MediaKind::kVideo, uhd));

  CodecConstraints fast;
  fast.framerate = 90;
  EXPECT_FALSE(CodecRegistry::MeetsConstraints(*h264, MediaKind::kVideo, fast));

  // AV1 is decode-only in the default catalog.
  EXPECT_FALSE(CodecRegistry::MeetsConstraints(*av1, MediaKind::kVideo, CodecConstraints{}));
  CodecConstraints decode_only;
  decode_only.require_encode = false;
  EXPECT_TRUE(CodecRegistry::MeetsConstraints(*av1, MediaKind::kVideo, decode_only));

  CodecConstraints ogg;
  ogg.container = "ogg";
  EXPECT_TRUE(CodecRegistry::MeetsConstraints(*opus, MediaKind::kAudio, ogg));
  EXPECT_FALSE(CodecRegistry::MeetsConstraints(*h264, MediaKind::kVideo, ogg));
  EXPECT_FALSE(CodecRegistry::MeetsConstraints(*opus, MediaKind::kVideo, CodecConstraints{}));

  CodecConstraints aac_only;
  aac_only.compatibility = {"AAC"};
  auto audio = registry_.Select(MediaKind::kAudio, aac_only);
  ASSERT_TRUE(audio.has_value());
  EXPECT_EQ(audio->name, "AAC");
}

// Rule: CODEC-002 Score rewards bitrate fit, hardware, compatibility rank and hints.
TEST_F(CodecRegistryContractTest, CODEC_002_ScoringPreferences) {
  CodecConstraints latency;
  latency.low_latency = true;
  auto video = registry_.Select(MediaKind::kVideo, latency);
  ASSERT_TRUE(video.has_value());
  EXPECT_EQ(video->name, "H264");

  CodecConstraints constrained;
  constrained.bandwidth_constrained = true;
  constrained.compatibility = {"VP9", "H264"};
  video = registry_.Select(MediaKind::kVideo, constrained);
  ASSERT_TRUE(video.has_value());
  EXPECT_EQ(video->name, "VP9");

  const auto h264 = registry_.Find("H264");
  CodecConstraints plain;
  CodecConstraints hw;
  hw.prefer_hw_accel = true;
  EXPECT_GT(registry_.Score(*h264, hw), registry_.Score(*h264, plain));
}

// Rule: CODEC-003 Register is an idempotent upsert by name.
TEST_F(CodecRegistryContractTest, CODEC_003_RegisterUpserts) {
  const size_t before = registry_.Size();
  CodecProfile replacement = *registry_.Find("H264");
  replacement.priority = 1;
  registry_.Register(replacement);
  registry_.Register(replacement);
  EXPECT_EQ(registry_.Size(), before);
  EXPECT_EQ(registry_.Find("H264")->priority, 1);

  EXPECT_TRUE(registry_.Unregister("H264"));
  EXPECT_FALSE(registry_.Unregister("H264"));
  EXPECT_FALSE(registry_.Find("H264").has_value());
  EXPECT_EQ(registry_.Profiles(MediaKind::kAudio).size(), 2u);
}

// Rule: CODEC-004 Ladders are strictly increasing in bitrate and never shrink in resolution.
TEST_F(CodecRegistryContractTest, CODEC_004_VideoLadderIsMonotonic) {
  const QualityLadder ladder = registry_.BuildLadder("H264", 8'000'000);
  ASSERT_EQ(ladder.size(), registry_.config().ladder_rung_count);
  EXPECT_EQ(ladder.front().name, "low");
  EXPECT_EQ(ladder.back().bitrate_bps, 8'000'000);
  EXPECT_EQ(ladder.front().resolution, (Resolution{854, 480}));
  EXPECT_EQ(ladder.back().resolution, (Resolution{1920, 1080}));
  for (size_t i = 0; i < ladder.size(); ++i) {
    EXPECT_EQ(ladder[i].index, i);
    EXPECT_EQ(ladder[i].codec, "H264");
    EXPECT_EQ(ladder[i].framerate, 30);
    if (i > 0) {
      EXPECT_GT(ladder[i].bitrate_bps, ladder[i - 1].bitrate_bps);
      EXPECT_GE(ladder[i].resolution.Pixels(), ladder[i - 1].resolution.Pixels());
    }
  }
}

// Rule: CODEC-004 The codec's own ceiling bounds the ladder; audio rungs carry sample rates.
TEST_F(CodecRegistryContractTest, CODEC_004_AudioLadderBoundedByCodec) {
  const QualityLadder ladder = registry_.BuildLadder("Opus", 1'000'000);
  ASSERT_EQ(ladder.size(), 4u);
  EXPECT_EQ(ladder.back().bitrate_bps, 510'000);
  EXPECT_EQ(ladder.front().sample_rate, 44'100);
  EXPECT_EQ(ladder.back().sample_rate, 48'000);
  for (const auto& level : ladder) {
    EXPECT_EQ(level.resolution, Resolution{});
    EXPECT_LE(level.bitrate_bps, 510'000);
  }
}

// Rule: CODEC-005 Unusable ladder requests produce an empty ladder; bad config throws.
TEST_F(CodecRegistryContractTest, CODEC_005_DegenerateLadders) {
  EXPECT_TRUE(registry_.BuildLadder("NOPE", 8'000'000).empty());
  EXPECT_TRUE(registry_.BuildLadder("H264", 2).empty());

  CodecConfig six;
  six.ladder_rung_count = 6;
  CodecRegistry wide(six);
  EXPECT_EQ(wide.BuildLadder("VP9", 30'000'000).size(), 6u);

  CodecConfig too_few;
  too_few.ladder_rung_count = 2;
  EXPECT_THROW({ CodecRegistry r(too_few); }, std::invalid_argument);
  CodecConfig too_many;
  too_many.ladder_rung_count = 7;
  EXPECT_THROW({ CodecRegistry r(too_many); }, std::invalid_argument);
}

}  // namespace
