// Repository: streamcore
// Component: BufferPool
// Purpose: Per-stream ordered jitter buffer with watermark flow control,
//          scored eviction, dependency-aware delivery and underrun detection.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_BUFFER_BUFFER_POOL_HPP_
#define STREAMCORE_BUFFER_BUFFER_POOL_HPP_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "streamcore/buffer/BufferConfig.hpp"
#include "streamcore/buffer/Chunk.hpp"

namespace streamcore::buffer {

enum class AdmissionResult {
  kAdmitted,
  kAdmittedWithEviction,
  kRejectedFull,       // at capacity and eviction could not free a slot
  kRejectedLate,       // would sort before a chunk already delivered
  kRejectedDuplicate,  // sequence already buffered
  kRejectedInvalid,    // null chunk or wrong stream
  kUnknownStream,      // pool closed or never created
};

const char* AdmissionResultToString(AdmissionResult result);

struct AdmissionOutcome {
  AdmissionResult result = AdmissionResult::kUnknownStream;
  size_t evicted = 0;
  // Sequences that could not be evicted because a SyncPoint pins them.
  std::vector<uint64_t> blocked_by_pins;
  bool underrun_cleared = false;
  bool above_high_water = false;
  bool above_critical = false;

  bool admitted() const {
    return result == AdmissionResult::kAdmitted ||
           result == AdmissionResult::kAdmittedWithEviction;
  }
};

enum class NextChunkStatus {
  kDelivered,
  kEmpty,                 // nothing buffered
  kNotReady,              // head chunk is in the future
  kDependencyUnresolved,  // head chunk waits for a dependency
  kUnknownStream,
};

const char* NextChunkStatusToString(NextChunkStatus status);

struct NextChunkResult {
  NextChunkStatus status = NextChunkStatus::kUnknownStream;
  ChunkPtr chunk;
  // Chunks discarded because a dependency was lost or can no longer be
  // delivered in order.
  size_t dropped = 0;
  // True exactly once per starvation episode.
  bool underrun_raised = false;
};

struct PoolMetrics {
  size_t size = 0;
  size_t capacity = 0;
  double level = 0.0;  // size / capacity
  size_t bytes_buffered = 0;
  uint64_t underrun_count = 0;
  uint64_t overrun_count = 0;
  double latency_avg_ms = 0.0;  // mean residency of delivered chunks
  double jitter_ms = 0.0;       // RFC 3550 interarrival jitter
  double throughput_bps = 0.0;  // admitted payload bits per second
  uint64_t chunks_admitted = 0;
  uint64_t chunks_delivered = 0;
  uint64_t chunks_evicted = 0;
  uint64_t chunks_rejected = 0;
  int64_t target_latency_ms = 0;
};

struct PoolSnapshot {
  std::string stream_id;
  MediaKind kind = MediaKind::kData;
  CapacityStrategy strategy = CapacityStrategy::kFixed;
  Watermarks watermarks;
  PoolMetrics metrics;
  bool underrun_active = false;
};

// BufferPool owns the ordered chunks of one stream.
//
// Ordering: chunks are kept sorted by (timestamp, sequence) and only the head
// is ever delivered, so NextChunk results are non-decreasing in timestamp.
// A chunk that would sort before the last delivered chunk is rejected.
//
// Thread safety: all public methods are mutex-protected. Close() makes every
// later call observe the pool as gone (kUnknownStream).
class BufferPool {
 public:
  // Throws std::invalid_argument if the watermarks violate
  // low < high < critical <= capacity.
  BufferPool(std::string stream_id,
             MediaKind kind,
             CapacityStrategy strategy,
             size_t capacity,
             Watermarks watermarks,
             const BufferConfig& config,
             int64_t created_at_ms);

  BufferPool(const BufferPool&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;

  // Inserts at the sorted position. When the pool is at capacity, evicts
  // first; fails without throwing when eviction cannot free a slot.
  AdmissionOutcome Add(ChunkPtr chunk, int64_t arrival_ms);

  // Returns the head chunk when its timestamp <= now_ms and every dependency
  // has already been delivered.
  NextChunkResult Next(int64_t now_ms);

  // Evicts up to `needed` chunks by score. Pinned chunks are skipped and
  // reported through blocked_by_pins. Returns number evicted.
  size_t Evict(size_t needed, std::vector<uint64_t>* blocked_by_pins = nullptr);

  // Drops all chunks and resets metrics. Returns count removed.
  size_t Flush();

  // Changes capacity and re-derives watermarks from fractions. Excess chunks
  // are evicted. Throws std::invalid_argument if the capacity is too small.
  size_t Resize(size_t capacity, const WatermarkFractions& fractions);

  // Pinned chunks are needed by an active SyncPoint and are never evicted.
  void Pin(uint64_t sequence);
  void Unpin(uint64_t sequence);
  bool IsPinned(uint64_t sequence) const;

  void SetTargetLatencyMs(int64_t target_latency_ms);
  int64_t TargetLatencyMs() const;

  // Marks the pool as destroyed.
  void Close();
  bool IsClosed() const;

  size_t Size() const;
  size_t Capacity() const;
  Watermarks GetWatermarks() const;
  bool IsBelowLowWater() const;
  bool IsAboveHighWater() const;
  bool IsAboveCritical() const;
  bool UnderrunActive() const;

  PoolSnapshot Snapshot() const;

  const std::string& stream_id() const { return stream_id_; }
  MediaKind kind() const { return kind_; }
  CapacityStrategy strategy() const { return strategy_; }

 private:
  struct Entry {
    ChunkPtr chunk;
    int64_t arrival_ms = 0;
  };

  size_t EvictLocked(size_t needed, std::vector<uint64_t>* blocked_by_pins);
  bool HasDependentsLocked(uint64_t sequence) const;
  bool ContainsSequenceLocked(uint64_t sequence) const;
  void RememberDelivered(uint64_t sequence, int64_t timestamp_ms);
  void RememberDropped(uint64_t sequence);
  void ResetMetricsLocked();
  void UpdateStarvationLocked(int64_t now_ms, NextChunkResult& result);

  mutable std::mutex mutex_;

  const std::string stream_id_;
  const MediaKind kind_;
  const CapacityStrategy strategy_;
  const EvictionWeights weights_;
  const int64_t underrun_grace_ms_;
  const int64_t dependency_timeout_ms_;

  size_t capacity_;
  Watermarks watermarks_;
  int64_t target_latency_ms_ = 0;
  bool closed_ = false;

  std::deque<Entry> entries_;
  std::set<uint64_t> pinned_;

  // Bounded history used for dependency resolution.
  std::set<uint64_t> delivered_;
  std::deque<uint64_t> delivered_order_;
  std::set<uint64_t> dropped_;
  std::deque<uint64_t> dropped_order_;
  bool has_delivered_ = false;
  int64_t last_delivered_timestamp_ms_ = 0;
  uint64_t last_delivered_sequence_ = 0;

  // Starvation / underrun tracking.
  int64_t starved_since_ms_ = -1;
  int64_t dependency_wait_since_ms_ = -1;
  uint64_t dependency_wait_sequence_ = 0;
  bool underrun_active_ = false;

  // Jitter tracking (previous admitted chunk).
  bool has_previous_arrival_ = false;
  int64_t previous_arrival_ms_ = 0;
  int64_t previous_timestamp_ms_ = 0;

  int64_t metrics_epoch_ms_;
  size_t bytes_buffered_ = 0;
  uint64_t bytes_admitted_ = 0;
  uint64_t underrun_count_ = 0;
  uint64_t overrun_count_ = 0;
  double latency_sum_ms_ = 0.0;
  double jitter_ms_ = 0.0;
  int64_t last_activity_ms_ = 0;
  uint64_t chunks_admitted_ = 0;
  uint64_t chunks_delivered_ = 0;
  uint64_t chunks_evicted_ = 0;
  uint64_t chunks_rejected_ = 0;
};

}  // namespace streamcore::buffer

#endif  // STREAMCORE_BUFFER_BUFFER_POOL_HPP_
