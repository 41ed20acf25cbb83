// Repository: streamcore
// Component: FormatDetector Contract Tests
// Purpose: Container signatures and extension mapping.
// Copyright (c) 2025 StreamCore

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

#include "streamcore/codec/FormatDetector.hpp"

using namespace streamcore::codec;
using namespace streamcore::tests;

namespace {

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("Codec", {"CODEC-006", "CODEC-007"});
  return true;
}();

std::vector<uint8_t> Bytes(std::initializer_list<int> values) {
  std::vector<uint8_t> out;
  for (int v : values) out.push_back(static_cast<uint8_t>(v));
  return out;
}

class FormatDetectorContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "Codec"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"CODEC-006", "CODEC-007"};
  }
};

// Rule: CODEC-006 Known container signatures map to format and default codec.
TEST_F(FormatDetectorContractTest, CODEC_006_Signatures) {
  auto mp4 = DetectFormat(Bytes({0x00, 0x00, 0x00, 0x18, 'f', 't', 'y', 'p', 'i', 's', 'o', 'm'}));
  ASSERT_TRUE(mp4.has_value());
  EXPECT_EQ(mp4->format, "mp4");
  EXPECT_EQ(mp4->codec, "H264");
  EXPECT_EQ(mp4->metadata.at("brand"), "isom");
  EXPECT_EQ(mp4->metadata.at("detected_by"), "signature");

  auto m4a = DetectFormat(Bytes({0x00, 0x00, 0x00, 0x20, 'f', 't', 'y', 'p', 'M', '4', 'A', ' '}));
  ASSERT_TRUE(m4a.has_value());
  EXPECT_EQ(m4a->format, "m4a");
  EXPECT_EQ(m4a->codec, "AAC");

  auto webm = DetectFormat(
      Bytes({0x1A, 0x45, 0xDF, 0xA3, 0x9F, 0x42, 0x82, 0x84, 'w', 'e', 'b', 'm'}));
  ASSERT_TRUE(webm.has_value());
  EXPECT_EQ(webm->format, "webm");
  EXPECT_EQ(webm->codec, "VP9");

  auto mkv = DetectFormat(
      Bytes({0x1A, 0x45, 0xDF, 0xA3, 0x9F, 0x42, 0x82, 0x88, 'm', 'a', 't', 'r'}));
  ASSERT_TRUE(mkv.has_value());
  EXPECT_EQ(mkv->format, "mkv");

  std::vector<uint8_t> ogg = Bytes({'O', 'g', 'g', 'S', 0x00, 0x02});
  ogg.resize(28, 0x00);
  for (char c : std::string("OpusHead")) ogg.push_back(static_cast<uint8_t>(c));
  auto opus = DetectFormat(ogg);
  ASSERT_TRUE(opus.has_value());
  EXPECT_EQ(opus->format, "ogg");
  EXPECT_EQ(opus->codec, "Opus");

  auto adts = DetectFormat(Bytes({0xFF, 0xF1, 0x50, 0x80, 0x02, 0x1F, 0xFC}));
  ASSERT_TRUE(adts.has_value());
  EXPECT_EQ(adts->format, "aac");
  EXPECT_EQ(adts->codec, "AAC");

  EXPECT_FALSE(DetectFormat(nullptr, 0).has_value());
  EXPECT_FALSE(DetectFormat(std::vector<uint8_t>{}).has_value());
}

// Rule: CODEC-006 Oversized inputs are probed over a bounded prefix.
TEST_F(FormatDetectorContractTest, CODEC_006_LargeInputProbesBoundedWindow) {
  // Two MiB of MPEG-TS packets: sync byte every 188 bytes.
  std::vector<uint8_t> ts(2 * kProbeWindowBytes, 0x00);
  for (size_t i = 0; i < ts.size(); i += 188) ts[i] = 0x47;

  auto info = DetectFormat(ts);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->format, "mpegts");
  EXPECT_EQ(info->metadata.at("detected_by"), "libavformat");
  EXPECT_EQ(info->metadata.at("probed_bytes"), std::to_string(kProbeWindowBytes));
}

// Rule: CODEC-007 Extensions map case-insensitively; unknown extensions are not guessed.
TEST_F(FormatDetectorContractTest, CODEC_007_Extensions) {
  auto mp4 = DetectFormatByExtension("/media/clip.MP4");
  ASSERT_TRUE(mp4.has_value());
  EXPECT_EQ(mp4->format, "mp4");
  EXPECT_EQ(mp4->codec, "H264");
  EXPECT_EQ(mp4->metadata.at("extension"), "mp4");

  auto opus = DetectFormatByExtension("voice.opus");
  ASSERT_TRUE(opus.has_value());
  EXPECT_EQ(opus->format, "ogg");
  EXPECT_EQ(opus->codec, "Opus");

  EXPECT_EQ(DetectFormatByExtension("a.mkv")->codec, "VP9");
  EXPECT_EQ(DetectFormatByExtension("a.m4a")->codec, "AAC");
  EXPECT_FALSE(DetectFormatByExtension("notes.txt").has_value());
  EXPECT_FALSE(DetectFormatByExtension("README").has_value());
  EXPECT_FALSE(DetectFormatByExtension("trailing.").has_value());
}

}  // namespace
