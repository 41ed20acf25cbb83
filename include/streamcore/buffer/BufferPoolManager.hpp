// Repository: streamcore
// Component: Buffer Pool Manager
// Purpose: Owns one BufferPool per active stream; sizes pools from strategy
//          and media kind, adapts them to network conditions and reports
//          aggregate statistics.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_BUFFER_BUFFER_POOL_MANAGER_HPP_
#define STREAMCORE_BUFFER_BUFFER_POOL_MANAGER_HPP_

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "streamcore/buffer/BufferConfig.hpp"
#include "streamcore/buffer/BufferPool.hpp"
#include "streamcore/buffer/Chunk.hpp"
#include "streamcore/core/MediaTypes.hpp"
#include "streamcore/timing/MasterClock.h"

namespace streamcore::buffer {

struct PoolStatistics {
  PoolSnapshot snapshot;
  // 1 - |target_level - level|, target level 0.5.
  double efficiency = 1.0;
  double performance_score = 1.0;
};

struct BufferStatistics {
  size_t total_pools = 0;
  size_t total_chunks = 0;
  size_t total_bytes = 0;
  double average_level = 0.0;
  uint64_t total_underruns = 0;
  uint64_t total_overruns = 0;
  uint64_t total_evicted = 0;
  double average_efficiency = 0.0;
  double performance_score = 0.0;
  std::map<std::string, PoolStatistics> pools;
};

struct PoolAdaptation {
  bool resized = false;
  size_t previous_capacity = 0;
  size_t new_capacity = 0;
  int64_t previous_target_latency_ms = 0;
  int64_t new_target_latency_ms = 0;
  size_t evicted = 0;
};

// Thread safety: the pool table is guarded by mutex_; each pool serializes
// its own operations, so different streams never contend on chunk traffic.
class BufferPoolManager {
 public:
  // Throws std::invalid_argument if clock is null or the configured
  // watermark fractions are out of order.
  BufferPoolManager(std::shared_ptr<timing::MasterClock> clock, BufferConfig config);

  BufferPoolManager(const BufferPoolManager&) = delete;
  BufferPoolManager& operator=(const BufferPoolManager&) = delete;

  // Creates the pool for stream_id with capacity from ComputeCapacity and
  // watermarks from the configured fractions. Returns nullptr if a pool for
  // the stream already exists.
  std::shared_ptr<BufferPool> CreatePool(const std::string& stream_id,
                                         MediaKind kind,
                                         CapacityStrategy strategy,
                                         int64_t target_latency_ms = 0);

  // Creates a pool with explicit capacity and watermarks.
  // Throws std::invalid_argument if the watermarks are out of order.
  std::shared_ptr<BufferPool> CreatePool(const std::string& stream_id,
                                         MediaKind kind,
                                         CapacityStrategy strategy,
                                         size_t capacity,
                                         Watermarks watermarks);

  std::shared_ptr<BufferPool> GetPool(const std::string& stream_id) const;
  bool HasPool(const std::string& stream_id) const;

  // Closes and forgets the pool. Holders of the old pointer see kUnknownStream.
  bool DestroyPool(const std::string& stream_id);

  AdmissionOutcome AddChunk(const std::string& stream_id, Chunk chunk);
  AdmissionOutcome AddChunk(const std::string& stream_id, ChunkPtr chunk);

  NextChunkResult NextChunk(const std::string& stream_id, int64_t current_time_ms);

  // True when `needed` more chunks fit without eviction.
  bool CapacityCheck(const std::string& stream_id, size_t needed) const;

  size_t Evict(const std::string& stream_id, size_t needed,
               std::vector<uint64_t>* blocked_by_pins = nullptr);

  // Returns the number of chunks dropped; 0 for unknown streams.
  size_t Flush(const std::string& stream_id);

  size_t ResizePool(const std::string& stream_id, size_t capacity);

  bool PinChunk(const std::string& stream_id, uint64_t sequence);
  bool UnpinChunk(const std::string& stream_id, uint64_t sequence);

  // Grows capacity / target latency under packet loss, high RTT or repeated
  // underruns. Resizes only when the capacity moves by more than 10%.
  PoolAdaptation AdaptToConditions(const std::string& stream_id,
                                   const NetworkConditions& conditions);

  size_t ComputeCapacity(MediaKind kind, CapacityStrategy strategy,
                         int64_t target_latency_ms) const;

  size_t PredictOptimalSize(MediaKind kind, int64_t bandwidth_bps,
                            const std::string& quality_name) const;

  BufferStatistics Statistics() const;

  std::vector<std::string> StreamIds() const;

  const BufferConfig& config() const { return config_; }

 private:
  static double Efficiency(const PoolSnapshot& snapshot);
  static double PerformanceScore(const PoolSnapshot& snapshot, double efficiency);
  size_t BaseCapacity(MediaKind kind) const;

  std::shared_ptr<timing::MasterClock> clock_;
  const BufferConfig config_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<BufferPool>> pools_;
};

}  // namespace streamcore::buffer

#endif  // STREAMCORE_BUFFER_BUFFER_POOL_MANAGER_HPP_
