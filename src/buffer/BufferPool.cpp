// Repository: streamcore
// Component: BufferPool
// Purpose: Per-stream ordered jitter buffer.
// Copyright (c) 2025 StreamCore

#include "streamcore/buffer/BufferPool.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <tuple>

#include "streamcore/util/Logger.hpp"

namespace streamcore::buffer {

namespace {
// Delivered/dropped sequence history kept for dependency resolution.
constexpr size_t kSequenceHistoryLimit = 4096;
}  // namespace

const char* AdmissionResultToString(AdmissionResult result) {
  switch (result) {
    case AdmissionResult::kAdmitted:             return "ADMITTED";
    case AdmissionResult::kAdmittedWithEviction: return "ADMITTED_WITH_EVICTION";
    case AdmissionResult::kRejectedFull:         return "REJECTED_FULL";
    case AdmissionResult::kRejectedLate:         return "REJECTED_LATE";
    case AdmissionResult::kRejectedDuplicate:    return "REJECTED_DUPLICATE";
    case AdmissionResult::kRejectedInvalid:      return "REJECTED_INVALID";
    case AdmissionResult::kUnknownStream:        return "UNKNOWN_STREAM";
  }
  return "UNKNOWN";
}

const char* NextChunkStatusToString(NextChunkStatus status) {
  switch (status) {
    case NextChunkStatus::kDelivered:            return "DELIVERED";
    case NextChunkStatus::kEmpty:                return "EMPTY";
    case NextChunkStatus::kNotReady:             return "NOT_READY";
    case NextChunkStatus::kDependencyUnresolved: return "DEPENDENCY_UNRESOLVED";
    case NextChunkStatus::kUnknownStream:        return "UNKNOWN_STREAM";
  }
  return "UNKNOWN";
}

BufferPool::BufferPool(std::string stream_id,
                       MediaKind kind,
                       CapacityStrategy strategy,
                       size_t capacity,
                       Watermarks watermarks,
                       const BufferConfig& config,
                       int64_t created_at_ms)
    : stream_id_(std::move(stream_id)),
      kind_(kind),
      strategy_(strategy),
      weights_(config.eviction_weights),
      underrun_grace_ms_(config.underrun_grace_ms),
      dependency_timeout_ms_(config.dependency_timeout_ms),
      capacity_(capacity),
      watermarks_(watermarks),
      metrics_epoch_ms_(created_at_ms),
      last_activity_ms_(created_at_ms) {
  ValidateWatermarks(capacity_, watermarks_);
}

AdmissionOutcome BufferPool::Add(ChunkPtr chunk, int64_t arrival_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  AdmissionOutcome outcome;

  if (closed_) {
    outcome.result = AdmissionResult::kUnknownStream;
    return outcome;
  }
  if (!chunk || chunk->stream_id != stream_id_) {
    chunks_rejected_++;
    outcome.result = AdmissionResult::kRejectedInvalid;
    return outcome;
  }
  if (has_delivered_ && chunk->timestamp_ms < last_delivered_timestamp_ms_) {
    chunks_rejected_++;
    outcome.result = AdmissionResult::kRejectedLate;
    util::Logger::Debug("[BufferPool] REJECT_LATE stream=" + stream_id_ +
                        " seq=" + std::to_string(chunk->sequence) +
                        " ts=" + std::to_string(chunk->timestamp_ms) +
                        " last_delivered_ts=" +
                        std::to_string(last_delivered_timestamp_ms_));
    return outcome;
  }
  if (delivered_.count(chunk->sequence) > 0 ||
      ContainsSequenceLocked(chunk->sequence)) {
    chunks_rejected_++;
    outcome.result = AdmissionResult::kRejectedDuplicate;
    return outcome;
  }

  if (entries_.size() >= capacity_) {
    overrun_count_++;
    const size_t needed = entries_.size() - capacity_ + 1;
    outcome.evicted = EvictLocked(needed, &outcome.blocked_by_pins);
    if (entries_.size() >= capacity_) {
      chunks_rejected_++;
      outcome.result = AdmissionResult::kRejectedFull;
      std::ostringstream oss;
      oss << "[BufferPool] ADMISSION_REJECTED stream=" << stream_id_
          << " seq=" << chunk->sequence << " size=" << entries_.size()
          << " capacity=" << capacity_
          << " pinned_blockers=" << outcome.blocked_by_pins.size();
      util::Logger::Warn(oss.str());
      return outcome;
    }
  }

  const auto pos = std::upper_bound(
      entries_.begin(), entries_.end(), *chunk,
      [](const Chunk& value, const Entry& entry) {
        return ChunkOrderLess(value, *entry.chunk);
      });

  // RFC 3550 interarrival jitter: J += (|D| - J) / 16.
  if (has_previous_arrival_) {
    const int64_t d = (arrival_ms - previous_arrival_ms_) -
                      (chunk->timestamp_ms - previous_timestamp_ms_);
    jitter_ms_ += (std::abs(static_cast<double>(d)) - jitter_ms_) / 16.0;
  }
  has_previous_arrival_ = true;
  previous_arrival_ms_ = arrival_ms;
  previous_timestamp_ms_ = chunk->timestamp_ms;

  bytes_buffered_ += chunk->payload.size();
  bytes_admitted_ += chunk->payload.size();
  chunks_admitted_++;
  last_activity_ms_ = std::max(last_activity_ms_, arrival_ms);

  util::Logger::Debug("[BufferPool] ADMIT stream=" + stream_id_ +
                      " seq=" + std::to_string(chunk->sequence) +
                      " ts=" + std::to_string(chunk->timestamp_ms));
  entries_.insert(pos, Entry{std::move(chunk), arrival_ms});

  if (underrun_active_ && entries_.size() >= watermarks_.low) {
    underrun_active_ = false;
    starved_since_ms_ = -1;
    outcome.underrun_cleared = true;
  }

  outcome.above_high_water = entries_.size() >= watermarks_.high;
  outcome.above_critical = entries_.size() >= watermarks_.critical;
  outcome.result = outcome.evicted > 0 ? AdmissionResult::kAdmittedWithEviction
                                       : AdmissionResult::kAdmitted;
  return outcome;
}

NextChunkResult BufferPool::Next(int64_t now_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  NextChunkResult result;

  if (closed_) {
    result.status = NextChunkStatus::kUnknownStream;
    return result;
  }

  while (true) {
    if (entries_.empty()) {
      result.status = NextChunkStatus::kEmpty;
      break;
    }

    const Entry& head = entries_.front();
    const Chunk& chunk = *head.chunk;
    if (chunk.timestamp_ms > now_ms) {
      result.status = NextChunkStatus::kNotReady;
      break;
    }

    bool unresolved = false;
    bool undeliverable = false;
    for (uint64_t dep : chunk.dependencies) {
      if (delivered_.count(dep) > 0) continue;
      // A lost dependency, or one buffered behind the head, can never be
      // delivered ahead of it without breaking timestamp order.
      if (dropped_.count(dep) > 0 || ContainsSequenceLocked(dep)) {
        undeliverable = true;
        break;
      }
      unresolved = true;
    }

    if (!undeliverable && unresolved) {
      if (dependency_wait_sequence_ != chunk.sequence || dependency_wait_since_ms_ < 0) {
        dependency_wait_sequence_ = chunk.sequence;
        dependency_wait_since_ms_ = now_ms;
      }
      if (now_ms - dependency_wait_since_ms_ < dependency_timeout_ms_) {
        result.status = NextChunkStatus::kDependencyUnresolved;
        break;
      }
      undeliverable = true;
    }

    if (undeliverable) {
      util::Logger::Debug("[BufferPool] DROP_UNDELIVERABLE stream=" + stream_id_ +
                          " seq=" + std::to_string(chunk.sequence));
      RememberDropped(chunk.sequence);
      bytes_buffered_ -= chunk.payload.size();
      chunks_evicted_++;
      result.dropped++;
      dependency_wait_since_ms_ = -1;
      entries_.pop_front();
      continue;
    }

    result.chunk = head.chunk;
    result.status = NextChunkStatus::kDelivered;
    bytes_buffered_ -= chunk.payload.size();
    latency_sum_ms_ += static_cast<double>(now_ms - chunk.timestamp_ms);
    chunks_delivered_++;
    dependency_wait_since_ms_ = -1;
    RememberDelivered(chunk.sequence, chunk.timestamp_ms);
    entries_.pop_front();
    break;
  }

  UpdateStarvationLocked(now_ms, result);
  return result;
}

void BufferPool::UpdateStarvationLocked(int64_t now_ms, NextChunkResult& result) {
  if (result.status == NextChunkStatus::kDelivered) {
    starved_since_ms_ = -1;
    if (underrun_active_ && entries_.size() >= watermarks_.low) {
      underrun_active_ = false;
    }
    return;
  }

  if (starved_since_ms_ < 0) {
    starved_since_ms_ = now_ms;
  }
  const bool primed = chunks_admitted_ > 0;
  if (!underrun_active_ && primed && entries_.size() < watermarks_.low &&
      now_ms - starved_since_ms_ >= underrun_grace_ms_) {
    underrun_active_ = true;
    underrun_count_++;
    result.underrun_raised = true;
    std::ostringstream oss;
    oss << "[BufferPool] UNDERRUN stream=" << stream_id_
        << " status=" << NextChunkStatusToString(result.status)
        << " size=" << entries_.size() << " low=" << watermarks_.low
        << " starved_ms=" << (now_ms - starved_since_ms_)
        << " count=" << underrun_count_;
    util::Logger::Warn(oss.str());
  }
}

size_t BufferPool::Evict(size_t needed, std::vector<uint64_t>* blocked_by_pins) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) return 0;
  return EvictLocked(needed, blocked_by_pins);
}

size_t BufferPool::EvictLocked(size_t needed, std::vector<uint64_t>* blocked_by_pins) {
  if (needed == 0 || entries_.empty()) return 0;

  const int64_t oldest_ts = entries_.front().chunk->timestamp_ms;
  const int64_t newest_ts = entries_.back().chunk->timestamp_ms;
  const double span = static_cast<double>(std::max<int64_t>(1, newest_ts - oldest_ts));

  // (has_dependents, -score, index): independent chunks first, then by
  // descending eviction score, then oldest first.
  std::vector<std::tuple<bool, double, size_t>> candidates;
  std::vector<uint64_t> pinned_seen;
  candidates.reserve(entries_.size());
  for (size_t i = 0; i < entries_.size(); ++i) {
    const Chunk& chunk = *entries_[i].chunk;
    if (pinned_.count(chunk.sequence) > 0) {
      pinned_seen.push_back(chunk.sequence);
      continue;
    }
    const bool has_dependents = HasDependentsLocked(chunk.sequence);
    const double age = static_cast<double>(newest_ts - chunk.timestamp_ms) / span;
    const double score = weights_.age_weight * age -
                         weights_.priority_weight * chunk.priority -
                         weights_.dependency_weight * (has_dependents ? 1.0 : 0.0);
    candidates.emplace_back(has_dependents, -score, i);
  }
  std::sort(candidates.begin(), candidates.end());

  const size_t take = std::min(needed, candidates.size());
  std::vector<size_t> victims;
  victims.reserve(take);
  for (size_t i = 0; i < take; ++i) {
    victims.push_back(std::get<2>(candidates[i]));
  }
  std::sort(victims.rbegin(), victims.rend());

  for (size_t index : victims) {
    const Chunk& chunk = *entries_[index].chunk;
    util::Logger::Debug("[BufferPool] EVICT stream=" + stream_id_ +
                        " seq=" + std::to_string(chunk.sequence) +
                        " ts=" + std::to_string(chunk.timestamp_ms));
    RememberDropped(chunk.sequence);
    bytes_buffered_ -= chunk.payload.size();
    chunks_evicted_++;
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index));
  }

  if (take < needed && blocked_by_pins != nullptr) {
    blocked_by_pins->insert(blocked_by_pins->end(), pinned_seen.begin(), pinned_seen.end());
  }
  return take;
}

size_t BufferPool::Flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t removed = entries_.size();
  entries_.clear();
  ResetMetricsLocked();
  if (removed > 0) {
    util::Logger::Info("[BufferPool] FLUSH stream=" + stream_id_ +
                       " removed=" + std::to_string(removed));
  }
  return removed;
}

size_t BufferPool::Resize(size_t capacity, const WatermarkFractions& fractions) {
  const Watermarks watermarks = DeriveWatermarks(capacity, fractions);
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) return 0;
  const size_t previous = capacity_;
  capacity_ = capacity;
  watermarks_ = watermarks;
  size_t evicted = 0;
  if (entries_.size() > capacity_) {
    evicted = EvictLocked(entries_.size() - capacity_, nullptr);
  }
  std::ostringstream oss;
  oss << "[BufferPool] RESIZE stream=" << stream_id_ << " capacity=" << previous
      << "->" << capacity_ << " watermarks=" << watermarks_.low << "/"
      << watermarks_.high << "/" << watermarks_.critical << " evicted=" << evicted;
  util::Logger::Info(oss.str());
  return evicted;
}

void BufferPool::Pin(uint64_t sequence) {
  std::lock_guard<std::mutex> lock(mutex_);
  pinned_.insert(sequence);
}

void BufferPool::Unpin(uint64_t sequence) {
  std::lock_guard<std::mutex> lock(mutex_);
  pinned_.erase(sequence);
}

bool BufferPool::IsPinned(uint64_t sequence) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pinned_.count(sequence) > 0;
}

void BufferPool::SetTargetLatencyMs(int64_t target_latency_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  target_latency_ms_ = target_latency_ms;
}

int64_t BufferPool::TargetLatencyMs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return target_latency_ms_;
}

void BufferPool::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  entries_.clear();
  pinned_.clear();
  bytes_buffered_ = 0;
}

bool BufferPool::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t BufferPool::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

size_t BufferPool::Capacity() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return capacity_;
}

Watermarks BufferPool::GetWatermarks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return watermarks_;
}

bool BufferPool::IsBelowLowWater() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_admitted_ > 0 && entries_.size() < watermarks_.low;
}

bool BufferPool::IsAboveHighWater() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size() >= watermarks_.high;
}

bool BufferPool::IsAboveCritical() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size() >= watermarks_.critical;
}

bool BufferPool::UnderrunActive() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return underrun_active_;
}

PoolSnapshot BufferPool::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  PoolSnapshot snap;
  snap.stream_id = stream_id_;
  snap.kind = kind_;
  snap.strategy = strategy_;
  snap.watermarks = watermarks_;
  snap.underrun_active = underrun_active_;

  PoolMetrics& m = snap.metrics;
  m.size = entries_.size();
  m.capacity = capacity_;
  m.level = capacity_ > 0 ? static_cast<double>(entries_.size()) / capacity_ : 0.0;
  m.bytes_buffered = bytes_buffered_;
  m.underrun_count = underrun_count_;
  m.overrun_count = overrun_count_;
  m.latency_avg_ms = chunks_delivered_ > 0 ? latency_sum_ms_ / chunks_delivered_ : 0.0;
  m.jitter_ms = jitter_ms_;
  const int64_t elapsed_ms = last_activity_ms_ - metrics_epoch_ms_;
  m.throughput_bps = elapsed_ms > 0
      ? static_cast<double>(bytes_admitted_) * 8.0 * 1000.0 / elapsed_ms
      : 0.0;
  m.chunks_admitted = chunks_admitted_;
  m.chunks_delivered = chunks_delivered_;
  m.chunks_evicted = chunks_evicted_;
  m.chunks_rejected = chunks_rejected_;
  m.target_latency_ms = target_latency_ms_;
  return snap;
}

bool BufferPool::HasDependentsLocked(uint64_t sequence) const {
  for (const auto& entry : entries_) {
    if (entry.chunk->dependencies.count(sequence) > 0) return true;
  }
  return false;
}

bool BufferPool::ContainsSequenceLocked(uint64_t sequence) const {
  for (const auto& entry : entries_) {
    if (entry.chunk->sequence == sequence) return true;
  }
  return false;
}

void BufferPool::RememberDelivered(uint64_t sequence, int64_t timestamp_ms) {
  has_delivered_ = true;
  last_delivered_timestamp_ms_ = timestamp_ms;
  last_delivered_sequence_ = sequence;
  if (delivered_.insert(sequence).second) {
    delivered_order_.push_back(sequence);
    if (delivered_order_.size() > kSequenceHistoryLimit) {
      delivered_.erase(delivered_order_.front());
      delivered_order_.pop_front();
    }
  }
}

void BufferPool::RememberDropped(uint64_t sequence) {
  if (dropped_.insert(sequence).second) {
    dropped_order_.push_back(sequence);
    if (dropped_order_.size() > kSequenceHistoryLimit) {
      dropped_.erase(dropped_order_.front());
      dropped_order_.pop_front();
    }
  }
}

void BufferPool::ResetMetricsLocked() {
  bytes_buffered_ = 0;
  bytes_admitted_ = 0;
  underrun_count_ = 0;
  overrun_count_ = 0;
  latency_sum_ms_ = 0.0;
  jitter_ms_ = 0.0;
  chunks_admitted_ = 0;
  chunks_delivered_ = 0;
  chunks_evicted_ = 0;
  chunks_rejected_ = 0;
  metrics_epoch_ms_ = last_activity_ms_;
  has_previous_arrival_ = false;
  starved_since_ms_ = -1;
  underrun_active_ = false;
  dependency_wait_since_ms_ = -1;
  delivered_.clear();
  delivered_order_.clear();
  dropped_.clear();
  dropped_order_.clear();
  has_delivered_ = false;
  last_delivered_timestamp_ms_ = 0;
  last_delivered_sequence_ = 0;
}

}  // namespace streamcore::buffer
