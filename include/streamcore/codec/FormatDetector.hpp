// Repository: streamcore
// Component: Format Detector
// Purpose: Signature and extension based container/codec detection.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_CODEC_FORMAT_DETECTOR_HPP_
#define STREAMCORE_CODEC_FORMAT_DETECTOR_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "streamcore/codec/CodecTypes.hpp"

namespace streamcore::codec {

// Largest prefix handed to libavformat's probe.
constexpr size_t kProbeWindowBytes = 1 << 20;

// Pure functions; no registry or global state is touched.
//
// Known signatures (ISO-BMFF ftyp, EBML, OggS, ADTS) are matched directly.
// Anything else is handed to libavformat's probe over at most
// kProbeWindowBytes, which reports the container but leaves codec empty.
std::optional<FormatInfo> DetectFormat(const uint8_t* data, size_t size);
std::optional<FormatInfo> DetectFormat(const std::vector<uint8_t>& data);

// Maps a file extension (.mp4 .m4a .webm .mkv .ogg .opus .aac) to format and
// default codec.
std::optional<FormatInfo> DetectFormatByExtension(const std::string& path);

}  // namespace streamcore::codec

#endif  // STREAMCORE_CODEC_FORMAT_DETECTOR_HPP_
