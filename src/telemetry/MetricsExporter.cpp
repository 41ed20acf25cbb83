// Repository: streamcore
// Component: Metrics Exporter
// Purpose: Prometheus text rendering of core statistics.
// Copyright (c) 2025 StreamCore

#include "streamcore/telemetry/MetricsExporter.h"

#include <sstream>
#include <utility>
#include <vector>

#include "streamcore/runtime/StreamCore.hpp"

namespace streamcore::telemetry {

namespace {

void Header(std::ostringstream& out, const char* name, const char* type, const char* help) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " " << type << "\n";
}

template <typename T>
void Sample(std::ostringstream& out, const char* name, const std::string& labels, T value) {
  out << name;
  if (!labels.empty()) out << "{" << labels << "}";
  out << " " << value << "\n";
}

std::string Label(const char* key, const std::string& value) {
  return std::string(key) + "=\"" + value + "\"";
}

}  // namespace

MetricsExporter::MetricsExporter(const runtime::StreamCore& core) : core_(core) {}

void MetricsExporter::RegisterCustomMetricsProvider(const std::string& name,
                                                    CustomMetricsProvider provider) {
  std::lock_guard<std::mutex> lock(providers_mutex_);
  providers_[name] = std::move(provider);
}

void MetricsExporter::UnregisterCustomMetricsProvider(const std::string& name) {
  std::lock_guard<std::mutex> lock(providers_mutex_);
  providers_.erase(name);
}

std::string MetricsExporter::Render() const {
  std::ostringstream out;

  // Buffers.
  const buffer::BufferStatistics pools = core_.pools().Statistics();
  Header(out, "streamcore_buffer_level", "gauge", "Fill level of the pool (size / capacity).");
  for (const auto& [id, pool] : pools.pools) {
    Sample(out, "streamcore_buffer_level", Label("stream", id), pool.snapshot.metrics.level);
  }
  Header(out, "streamcore_buffer_chunks", "gauge", "Chunks currently buffered.");
  for (const auto& [id, pool] : pools.pools) {
    Sample(out, "streamcore_buffer_chunks", Label("stream", id), pool.snapshot.metrics.size);
  }
  Header(out, "streamcore_buffer_capacity_chunks", "gauge", "Pool capacity in chunks.");
  for (const auto& [id, pool] : pools.pools) {
    Sample(out, "streamcore_buffer_capacity_chunks", Label("stream", id),
           pool.snapshot.metrics.capacity);
  }
  Header(out, "streamcore_buffer_underruns_total", "counter", "Underrun episodes raised.");
  for (const auto& [id, pool] : pools.pools) {
    Sample(out, "streamcore_buffer_underruns_total", Label("stream", id),
           pool.snapshot.metrics.underrun_count);
  }
  Header(out, "streamcore_buffer_overruns_total", "counter", "Admissions that hit capacity.");
  for (const auto& [id, pool] : pools.pools) {
    Sample(out, "streamcore_buffer_overruns_total", Label("stream", id),
           pool.snapshot.metrics.overrun_count);
  }
  Header(out, "streamcore_buffer_evicted_total", "counter", "Chunks evicted to make room.");
  for (const auto& [id, pool] : pools.pools) {
    Sample(out, "streamcore_buffer_evicted_total", Label("stream", id),
           pool.snapshot.metrics.chunks_evicted);
  }
  Header(out, "streamcore_buffer_jitter_ms", "gauge", "Interarrival jitter estimate.");
  for (const auto& [id, pool] : pools.pools) {
    Sample(out, "streamcore_buffer_jitter_ms", Label("stream", id),
           pool.snapshot.metrics.jitter_ms);
  }
  Header(out, "streamcore_buffer_latency_avg_ms", "gauge", "Mean residency of delivered chunks.");
  for (const auto& [id, pool] : pools.pools) {
    Sample(out, "streamcore_buffer_latency_avg_ms", Label("stream", id),
           pool.snapshot.metrics.latency_avg_ms);
  }
  Header(out, "streamcore_buffer_performance_score", "gauge", "Aggregate pool health in [0,1].");
  Sample(out, "streamcore_buffer_performance_score", "", pools.performance_score);

  // Sync.
  const timing::SyncStatistics sync = core_.coordinator().Statistics();
  Header(out, "streamcore_sync_state", "gauge", "Session sync state ordinal.");
  Sample(out, "streamcore_sync_state", Label("state", timing::SyncStateToString(sync.state)),
         static_cast<int>(sync.state));
  Header(out, "streamcore_sync_pending_points", "gauge", "SyncPoints awaiting arrivals.");
  Sample(out, "streamcore_sync_pending_points", "", sync.pending_sync_points);
  Header(out, "streamcore_sync_corrections_total", "counter", "Rate corrections scheduled.");
  Sample(out, "streamcore_sync_corrections_total", "", sync.corrections);
  Header(out, "streamcore_sync_desyncs_total", "counter", "Desync events raised.");
  Sample(out, "streamcore_sync_desyncs_total", "", sync.desync_events);
  Header(out, "streamcore_sync_expired_total", "counter", "SyncPoints that expired.");
  Sample(out, "streamcore_sync_expired_total", "", sync.expired_sync_points);
  Header(out, "streamcore_sync_master_accuracy_ms", "gauge", "Master reference accuracy.");
  Sample(out, "streamcore_sync_master_accuracy_ms", "", sync.master_accuracy_ms);

  // Adaptation.
  const adaptation::AdaptationStatistics adapt = core_.engine().Statistics();
  Header(out, "streamcore_adaptation_decisions_total", "counter", "Decisions by action.");
  for (const auto& [action, count] : adapt.by_action) {
    Sample(out, "streamcore_adaptation_decisions_total", Label("action", action), count);
  }
  Header(out, "streamcore_adaptation_emergencies_total", "counter", "Emergency decisions.");
  Sample(out, "streamcore_adaptation_emergencies_total", "", adapt.emergencies);
  Header(out, "streamcore_adaptation_forced_total", "counter", "Forced quality changes applied.");
  Sample(out, "streamcore_adaptation_forced_total", "", adapt.forced);
  Header(out, "streamcore_adaptation_average_confidence", "gauge", "Mean decision confidence.");
  Sample(out, "streamcore_adaptation_average_confidence", "", adapt.average_confidence);

  // Channels.
  const std::vector<std::pair<const char*, std::pair<size_t, uint64_t>>> channels = {
      {"decisions", {core_.decisions().Size(), core_.decisions().overflow_total()}},
      {"underruns", {core_.underruns().Size(), core_.underruns().overflow_total()}},
      {"desyncs", {core_.desyncs().Size(), core_.desyncs().overflow_total()}},
      {"evictions", {core_.evictions().Size(), core_.evictions().overflow_total()}},
  };
  Header(out, "streamcore_channel_depth", "gauge", "Events waiting on the channel.");
  for (const auto& [name, values] : channels) {
    Sample(out, "streamcore_channel_depth", Label("channel", name), values.first);
  }
  Header(out, "streamcore_channel_overflow_total", "counter", "Pushes that found the channel at capacity.");
  for (const auto& [name, values] : channels) {
    Sample(out, "streamcore_channel_overflow_total", Label("channel", name), values.second);
  }

  std::lock_guard<std::mutex> lock(providers_mutex_);
  for (const auto& [name, provider] : providers_) {
    if (provider) out << provider();
  }
  return out.str();
}

}  // namespace streamcore::telemetry
