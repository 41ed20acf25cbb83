// Repository: streamcore
// Component: Chunk
// Purpose: Unit of media admitted into a BufferPool.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_BUFFER_CHUNK_HPP_
#define STREAMCORE_BUFFER_CHUNK_HPP_

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "streamcore/core/MediaTypes.hpp"

namespace streamcore::buffer {

// Chunk is immutable once admitted: pools hold it as shared_ptr<const Chunk>
// and hand the same object back from NextChunk.
struct Chunk {
  std::string stream_id;
  uint64_t sequence = 0;
  int64_t timestamp_ms = 0;
  MediaKind kind = MediaKind::kData;
  std::vector<uint8_t> payload;

  // Sequences that must be delivered before this chunk.
  std::set<uint64_t> dependencies;

  int priority = 0;
};

using ChunkPtr = std::shared_ptr<const Chunk>;

// Pool ordering: timestamp, ties broken by sequence.
inline bool ChunkOrderLess(const Chunk& a, const Chunk& b) {
  if (a.timestamp_ms != b.timestamp_ms) return a.timestamp_ms < b.timestamp_ms;
  return a.sequence < b.sequence;
}

}  // namespace streamcore::buffer

#endif  // STREAMCORE_BUFFER_CHUNK_HPP_
