// Repository: streamcore
// Component: Event Channel
// Purpose: Bounded per-consumer event queue for outbound notifications.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_RUNTIME_EVENT_CHANNEL_HPP_
#define STREAMCORE_RUNTIME_EVENT_CHANNEL_HPP_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace streamcore::runtime {

enum class OverflowPolicy {
  // A full queue discards its OLDEST event to make room.
  kDropOldest,
  // Capacity is a soft bound: every event is kept and delivered once.
  kRetainAll,
};

inline const char* OverflowPolicyToString(OverflowPolicy policy) {
  switch (policy) {
    case OverflowPolicy::kDropOldest: return "drop_oldest";
    case OverflowPolicy::kRetainAll:  return "retain_all";
  }
  return "unknown";
}

// EventChannel<T> is a bounded FIFO owned by exactly one consumer.
// Producers Push from any thread; the consumer Polls or Drains.
//
// Events stay queued until taken. Under kDropOldest a stalled consumer loses
// history but always sees the latest state; this departs from at-least-once
// delivery and is only used for channels whose events are superseded by
// later ones (underruns, desyncs, evictions). Adaptation decisions use
// kRetainAll and are never dropped. Either way overflow_total() counts the
// pushes that found the queue at capacity.
template <typename T>
class EventChannel {
 public:
  explicit EventChannel(size_t capacity, OverflowPolicy policy = OverflowPolicy::kDropOldest)
      : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {}

  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;

  // Returns false when the queue was at capacity: an older event was
  // dropped, or under kRetainAll the queue grew past its bound.
  bool Push(T event) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool kept_all = true;
    if (queue_.size() >= capacity_) {
      if (policy_ == OverflowPolicy::kDropOldest) queue_.pop_front();
      ++overflow_total_;
      kept_all = false;
    }
    queue_.push_back(std::move(event));
    ++pushed_total_;
    return kept_all;
  }

  std::optional<T> Poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) return std::nullopt;
    T event = std::move(queue_.front());
    queue_.pop_front();
    return event;
  }

  std::vector<T> Drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> out(std::make_move_iterator(queue_.begin()),
                       std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  bool Empty() const { return Size() == 0; }
  size_t capacity() const { return capacity_; }
  OverflowPolicy policy() const { return policy_; }

  uint64_t overflow_total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overflow_total_;
  }

  uint64_t pushed_total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pushed_total_;
  }

 private:
  const size_t capacity_;
  const OverflowPolicy policy_;
  mutable std::mutex mutex_;
  std::deque<T> queue_;
  uint64_t overflow_total_ = 0;
  uint64_t pushed_total_ = 0;
};

}  // namespace streamcore::runtime

#endif  // STREAMCORE_RUNTIME_EVENT_CHANNEL_HPP_
