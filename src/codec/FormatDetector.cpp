// Repository: streamcore
// Component: Format Detector
// Purpose: Signature and extension based container/codec detection.
// Copyright (c) 2025 StreamCore

#include "streamcore/codec/FormatDetector.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

namespace streamcore::codec {

namespace {

// How far into the buffer to look for secondary markers (doctype, OpusHead).
constexpr size_t kMarkerScanBytes = 64;

bool HasMarker(const uint8_t* data, size_t size, const char* marker) {
  const size_t len = std::strlen(marker);
  const size_t limit = std::min(size, kMarkerScanBytes);
  if (limit < len) return false;
  for (size_t i = 0; i + len <= limit; ++i) {
    if (std::memcmp(data + i, marker, len) == 0) return true;
  }
  return false;
}

// Adds libavcodec's descriptor for the codec, when it knows it.
void AttachCodecDescriptor(FormatInfo& info) {
  if (info.codec.empty()) return;
  std::string ff_name = info.codec;
  std::transform(ff_name.begin(), ff_name.end(), ff_name.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  const AVCodecDescriptor* desc = avcodec_descriptor_get_by_name(ff_name.c_str());
  if (desc == nullptr) return;
  if (desc->long_name != nullptr) {
    info.metadata["codec_long_name"] = desc->long_name;
  }
  const char* media_type = av_get_media_type_string(desc->type);
  if (media_type != nullptr) {
    info.metadata["media_type"] = media_type;
  }
}

std::optional<FormatInfo> MatchSignature(const uint8_t* data, size_t size) {
  FormatInfo info;

  // ISO-BMFF: 4-byte box size, then "ftyp", then major brand.
  if (size >= 8 && std::memcmp(data + 4, "ftyp", 4) == 0) {
    std::string brand;
    if (size >= 12) brand.assign(reinterpret_cast<const char*>(data + 8), 4);
    if (brand == "M4A ") {
      info.format = "m4a";
      info.codec = "AAC";
    } else {
      info.format = "mp4";
      info.codec = "H264";
    }
    if (!brand.empty()) info.metadata["brand"] = brand;
    info.metadata["detected_by"] = "signature";
    return info;
  }

  // EBML header.
  if (size >= 4 && data[0] == 0x1A && data[1] == 0x45 && data[2] == 0xDF && data[3] == 0xA3) {
    const bool is_webm = HasMarker(data, size, "webm");
    info.format = is_webm ? "webm" : "mkv";
    info.codec = "VP9";
    info.metadata["detected_by"] = "signature";
    return info;
  }

  if (size >= 4 && std::memcmp(data, "OggS", 4) == 0) {
    info.format = "ogg";
    if (HasMarker(data, size, "OpusHead")) info.codec = "Opus";
    info.metadata["detected_by"] = "signature";
    return info;
  }

  // ADTS sync word 0xFFF, layer 0.
  if (size >= 2 && data[0] == 0xFF && (data[1] & 0xF6) == 0xF0) {
    info.format = "aac";
    info.codec = "AAC";
    info.metadata["detected_by"] = "signature";
    return info;
  }

  return std::nullopt;
}

std::optional<FormatInfo> ProbeWithLibavformat(const uint8_t* data, size_t size) {
  size = std::min(size, kProbeWindowBytes);
  // av_probe_input_format reads up to AVPROBE_PADDING_SIZE past the end.
  std::vector<uint8_t> padded(size + AVPROBE_PADDING_SIZE, 0);
  std::memcpy(padded.data(), data, size);

  AVProbeData probe{};
  probe.filename = "";
  probe.buf = padded.data();
  probe.buf_size = static_cast<int>(size);

  const AVInputFormat* fmt = av_probe_input_format(&probe, 1);
  if (fmt == nullptr || fmt->name == nullptr) return std::nullopt;

  FormatInfo info;
  // Demuxer names may list aliases: "mov,mp4,m4a,3gp,3g2,mj2".
  std::string name = fmt->name;
  const auto comma = name.find(',');
  info.format = comma == std::string::npos ? name : name.substr(0, comma);
  info.metadata["demuxer"] = name;
  if (fmt->long_name != nullptr) info.metadata["long_name"] = fmt->long_name;
  info.metadata["detected_by"] = "libavformat";
  info.metadata["probed_bytes"] = std::to_string(size);
  return info;
}

}  // namespace

std::optional<FormatInfo> DetectFormat(const uint8_t* data, size_t size) {
  if (data == nullptr || size == 0) return std::nullopt;

  auto info = MatchSignature(data, size);
  if (!info) {
    info = ProbeWithLibavformat(data, size);
  }
  if (info) {
    AttachCodecDescriptor(*info);
  }
  return info;
}

std::optional<FormatInfo> DetectFormat(const std::vector<uint8_t>& data) {
  return DetectFormat(data.data(), data.size());
}

std::optional<FormatInfo> DetectFormatByExtension(const std::string& path) {
  const auto dot = path.find_last_of('.');
  if (dot == std::string::npos || dot + 1 >= path.size()) return std::nullopt;
  std::string ext = path.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  FormatInfo info;
  if (ext == "mp4") {
    info = {"mp4", "H264", {}};
  } else if (ext == "m4a") {
    info = {"m4a", "AAC", {}};
  } else if (ext == "webm") {
    info = {"webm", "VP9", {}};
  } else if (ext == "mkv") {
    info = {"mkv", "VP9", {}};
  } else if (ext == "ogg" || ext == "opus") {
    info = {"ogg", "Opus", {}};
  } else if (ext == "aac") {
    info = {"aac", "AAC", {}};
  } else {
    return std::nullopt;
  }
  info.metadata["extension"] = ext;
  info.metadata["detected_by"] = "extension";
  return info;
}

}  // namespace streamcore::codec
