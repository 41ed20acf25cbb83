// Repository: streamcore
// Component: Buffer Pool Manager
// Purpose: Pool lifecycle, sizing, adaptation and statistics.
// Copyright (c) 2025 StreamCore

#include "streamcore/buffer/BufferPoolManager.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "streamcore/util/Logger.hpp"

namespace streamcore::buffer {

namespace {
constexpr double kTargetLevel = 0.5;
constexpr double kHighPacketLoss = 0.05;
constexpr int64_t kHighRttMs = 200;
constexpr int64_t kMinHighRttLatencyMs = 500;
constexpr uint64_t kUnderrunsBeforeGrowth = 5;
constexpr double kResizeThreshold = 0.10;
}  // namespace

BufferPoolManager::BufferPoolManager(std::shared_ptr<timing::MasterClock> clock,
                                     BufferConfig config)
    : clock_(std::move(clock)), config_(std::move(config)) {
  if (!clock_) {
    throw std::invalid_argument("BufferPoolManager requires a MasterClock");
  }
  // Surface bad fractions at construction rather than at first CreatePool.
  DeriveWatermarks(100, config_.watermark_fractions);
}

size_t BufferPoolManager::BaseCapacity(MediaKind kind) const {
  const double base = static_cast<double>(config_.base_capacity_chunks);
  switch (kind) {
    case MediaKind::kVideo: return static_cast<size_t>(base * config_.video_capacity_factor);
    case MediaKind::kData:  return static_cast<size_t>(base * config_.data_capacity_factor);
    case MediaKind::kAudio: break;
  }
  return config_.base_capacity_chunks;
}

size_t BufferPoolManager::ComputeCapacity(MediaKind kind, CapacityStrategy strategy,
                                          int64_t target_latency_ms) const {
  double capacity = static_cast<double>(BaseCapacity(kind));
  switch (strategy) {
    case CapacityStrategy::kFixed:      capacity *= config_.fixed_factor; break;
    case CapacityStrategy::kAdaptive:   capacity *= config_.adaptive_factor; break;
    case CapacityStrategy::kPredictive: capacity *= config_.predictive_factor; break;
  }
  if (target_latency_ms > 0) {
    if (target_latency_ms < config_.low_latency_ms) {
      capacity *= 0.5;
    } else if (target_latency_ms > config_.high_latency_ms) {
      capacity *= 2.0;
    }
  }
  return std::max<size_t>(3, static_cast<size_t>(std::llround(capacity)));
}

std::shared_ptr<BufferPool> BufferPoolManager::CreatePool(const std::string& stream_id,
                                                          MediaKind kind,
                                                          CapacityStrategy strategy,
                                                          int64_t target_latency_ms) {
  const size_t capacity = ComputeCapacity(kind, strategy, target_latency_ms);
  auto pool = CreatePool(stream_id, kind, strategy, capacity,
                         DeriveWatermarks(capacity, config_.watermark_fractions));
  if (pool) {
    pool->SetTargetLatencyMs(target_latency_ms);
  }
  return pool;
}

std::shared_ptr<BufferPool> BufferPoolManager::CreatePool(const std::string& stream_id,
                                                          MediaKind kind,
                                                          CapacityStrategy strategy,
                                                          size_t capacity,
                                                          Watermarks watermarks) {
  auto pool = std::make_shared<BufferPool>(stream_id, kind, strategy, capacity,
                                           watermarks, config_, clock_->now_utc_ms());
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pools_.count(stream_id) > 0) {
      util::Logger::Warn("[BufferPool] CREATE_REJECTED stream=" + stream_id +
                         " reason=exists");
      return nullptr;
    }
    pools_.emplace(stream_id, pool);
  }
  std::ostringstream oss;
  oss << "[BufferPool] CREATE stream=" << stream_id
      << " kind=" << MediaKindToString(kind)
      << " strategy=" << CapacityStrategyToString(strategy)
      << " capacity=" << capacity << " watermarks=" << watermarks.low << "/"
      << watermarks.high << "/" << watermarks.critical;
  util::Logger::Info(oss.str());
  return pool;
}

std::shared_ptr<BufferPool> BufferPoolManager::GetPool(const std::string& stream_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pools_.find(stream_id);
  return it == pools_.end() ? nullptr : it->second;
}

bool BufferPoolManager::HasPool(const std::string& stream_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pools_.count(stream_id) > 0;
}

bool BufferPoolManager::DestroyPool(const std::string& stream_id) {
  std::shared_ptr<BufferPool> pool;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(stream_id);
    if (it == pools_.end()) return false;
    pool = std::move(it->second);
    pools_.erase(it);
  }
  pool->Close();
  util::Logger::Info("[BufferPool] DESTROY stream=" + stream_id);
  return true;
}

AdmissionOutcome BufferPoolManager::AddChunk(const std::string& stream_id, Chunk chunk) {
  return AddChunk(stream_id, std::make_shared<const Chunk>(std::move(chunk)));
}

AdmissionOutcome BufferPoolManager::AddChunk(const std::string& stream_id, ChunkPtr chunk) {
  auto pool = GetPool(stream_id);
  if (!pool) {
    AdmissionOutcome outcome;
    outcome.result = AdmissionResult::kUnknownStream;
    return outcome;
  }
  return pool->Add(std::move(chunk), clock_->now_utc_ms());
}

NextChunkResult BufferPoolManager::NextChunk(const std::string& stream_id,
                                             int64_t current_time_ms) {
  auto pool = GetPool(stream_id);
  if (!pool) {
    return NextChunkResult{};
  }
  return pool->Next(current_time_ms);
}

bool BufferPoolManager::CapacityCheck(const std::string& stream_id, size_t needed) const {
  auto pool = GetPool(stream_id);
  if (!pool) return false;
  return pool->Size() + needed <= pool->Capacity();
}

size_t BufferPoolManager::Evict(const std::string& stream_id, size_t needed,
                                std::vector<uint64_t>* blocked_by_pins) {
  auto pool = GetPool(stream_id);
  return pool ? pool->Evict(needed, blocked_by_pins) : 0;
}

size_t BufferPoolManager::Flush(const std::string& stream_id) {
  auto pool = GetPool(stream_id);
  return pool ? pool->Flush() : 0;
}

size_t BufferPoolManager::ResizePool(const std::string& stream_id, size_t capacity) {
  auto pool = GetPool(stream_id);
  return pool ? pool->Resize(capacity, config_.watermark_fractions) : 0;
}

bool BufferPoolManager::PinChunk(const std::string& stream_id, uint64_t sequence) {
  auto pool = GetPool(stream_id);
  if (!pool) return false;
  pool->Pin(sequence);
  return true;
}

bool BufferPoolManager::UnpinChunk(const std::string& stream_id, uint64_t sequence) {
  auto pool = GetPool(stream_id);
  if (!pool) return false;
  pool->Unpin(sequence);
  return true;
}

PoolAdaptation BufferPoolManager::AdaptToConditions(const std::string& stream_id,
                                                    const NetworkConditions& conditions) {
  PoolAdaptation adaptation;
  auto pool = GetPool(stream_id);
  if (!pool) return adaptation;

  const PoolSnapshot snap = pool->Snapshot();
  adaptation.previous_capacity = snap.metrics.capacity;
  adaptation.previous_target_latency_ms = snap.metrics.target_latency_ms;

  double capacity = static_cast<double>(snap.metrics.capacity);
  int64_t target_latency = snap.metrics.target_latency_ms;

  if (conditions.packet_loss > kHighPacketLoss) {
    capacity *= 1.5;
  }
  if (conditions.rtt_ms > kHighRttMs) {
    target_latency = std::max<int64_t>(
        static_cast<int64_t>(std::llround(static_cast<double>(target_latency) * 1.2)),
        kMinHighRttLatencyMs);
  }
  if (snap.metrics.underrun_count > kUnderrunsBeforeGrowth) {
    capacity *= 1.3;
  }

  adaptation.new_capacity = static_cast<size_t>(std::llround(capacity));
  adaptation.new_target_latency_ms = target_latency;

  if (target_latency != snap.metrics.target_latency_ms) {
    pool->SetTargetLatencyMs(target_latency);
  }

  const double change = std::abs(capacity - static_cast<double>(snap.metrics.capacity)) /
                        static_cast<double>(snap.metrics.capacity);
  if (change > kResizeThreshold) {
    adaptation.evicted = pool->Resize(adaptation.new_capacity, config_.watermark_fractions);
    adaptation.resized = true;
  } else {
    adaptation.new_capacity = snap.metrics.capacity;
  }
  return adaptation;
}

size_t BufferPoolManager::PredictOptimalSize(MediaKind kind, int64_t bandwidth_bps,
                                             const std::string& quality_name) const {
  double multiplier = 1.0;
  if (bandwidth_bps > 0 && bandwidth_bps < 1'000'000) {
    multiplier *= 0.5;
  } else if (bandwidth_bps > 10'000'000) {
    multiplier *= 1.5;
  }
  if (quality_name == "high" || quality_name == "ultra") {
    multiplier *= 1.5;
  } else if (quality_name == "low") {
    multiplier *= 0.7;
  }
  const double size = static_cast<double>(BaseCapacity(kind)) * multiplier;
  return std::max<size_t>(3, static_cast<size_t>(std::llround(size)));
}

double BufferPoolManager::Efficiency(const PoolSnapshot& snapshot) {
  return std::max(0.0, 1.0 - std::abs(kTargetLevel - snapshot.metrics.level));
}

double BufferPoolManager::PerformanceScore(const PoolSnapshot& snapshot, double efficiency) {
  double score = 1.0;
  score -= static_cast<double>(snapshot.metrics.underrun_count +
                               snapshot.metrics.overrun_count) * 0.1;
  score *= efficiency;
  if (snapshot.metrics.jitter_ms > 50.0) {
    score *= 0.8;
  }
  return std::clamp(score, 0.0, 1.0);
}

BufferStatistics BufferPoolManager::Statistics() const {
  std::vector<std::shared_ptr<BufferPool>> pools;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, pool] : pools_) pools.push_back(pool);
  }

  BufferStatistics stats;
  double level_sum = 0.0;
  double efficiency_sum = 0.0;
  double score_sum = 0.0;
  for (const auto& pool : pools) {
    PoolStatistics ps;
    ps.snapshot = pool->Snapshot();
    ps.efficiency = Efficiency(ps.snapshot);
    ps.performance_score = PerformanceScore(ps.snapshot, ps.efficiency);

    stats.total_chunks += ps.snapshot.metrics.size;
    stats.total_bytes += ps.snapshot.metrics.bytes_buffered;
    stats.total_underruns += ps.snapshot.metrics.underrun_count;
    stats.total_overruns += ps.snapshot.metrics.overrun_count;
    stats.total_evicted += ps.snapshot.metrics.chunks_evicted;
    level_sum += ps.snapshot.metrics.level;
    efficiency_sum += ps.efficiency;
    score_sum += ps.performance_score;
    stats.pools.emplace(ps.snapshot.stream_id, std::move(ps));
  }
  stats.total_pools = pools.size();
  if (!pools.empty()) {
    const double n = static_cast<double>(pools.size());
    stats.average_level = level_sum / n;
    stats.average_efficiency = efficiency_sum / n;
    stats.performance_score = score_sum / n;
  }
  return stats;
}

std::vector<std::string> BufferPoolManager::StreamIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(pools_.size());
  for (const auto& [id, pool] : pools_) ids.push_back(id);
  return ids;
}

}  // namespace streamcore::buffer
