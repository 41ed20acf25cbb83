// Repository: streamcore
// Component: Metrics Exporter
// Purpose: Renders pool, sync, adaptation and channel statistics as
//          Prometheus text exposition.
// Copyright (c) 2025 StreamCore

#ifndef STREAMCORE_TELEMETRY_METRICS_EXPORTER_H_
#define STREAMCORE_TELEMETRY_METRICS_EXPORTER_H_

#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace streamcore::runtime {
class StreamCore;
}  // namespace streamcore::runtime

namespace streamcore::telemetry {

// MetricsExporter produces the text of a /metrics scrape. It owns no server;
// the embedding process decides how to expose Render().
//
// Metrics Exported:
// - streamcore_buffer_level{stream="S"} - gauge
// - streamcore_buffer_chunks{stream="S"} - gauge
// - streamcore_buffer_capacity_chunks{stream="S"} - gauge
// - streamcore_buffer_underruns_total{stream="S"} - counter
// - streamcore_buffer_overruns_total{stream="S"} - counter
// - streamcore_buffer_evicted_total{stream="S"} - counter
// - streamcore_buffer_jitter_ms{stream="S"} - gauge
// - streamcore_buffer_latency_avg_ms{stream="S"} - gauge
// - streamcore_buffer_performance_score - gauge
// - streamcore_sync_state - gauge (SyncState ordinal)
// - streamcore_sync_pending_points - gauge
// - streamcore_sync_corrections_total / _desyncs_total / _expired_total - counters
// - streamcore_adaptation_decisions_total{action="A"} - counter
// - streamcore_adaptation_emergencies_total / _forced_total - counters
// - streamcore_adaptation_average_confidence - gauge
// - streamcore_channel_depth{channel="C"} - gauge
// - streamcore_channel_overflow_total{channel="C"} - counter
class MetricsExporter {
 public:
  explicit MetricsExporter(const runtime::StreamCore& core);

  MetricsExporter(const MetricsExporter&) = delete;
  MetricsExporter& operator=(const MetricsExporter&) = delete;

  std::string Render() const;

  // Provider must be thread-safe and return valid exposition text; its
  // output is appended after the built-in metrics.
  using CustomMetricsProvider = std::function<std::string()>;
  void RegisterCustomMetricsProvider(const std::string& name, CustomMetricsProvider provider);
  void UnregisterCustomMetricsProvider(const std::string& name);

 private:
  const runtime::StreamCore& core_;

  mutable std::mutex providers_mutex_;
  std::map<std::string, CustomMetricsProvider> providers_;
};

}  // namespace streamcore::telemetry

#endif  // STREAMCORE_TELEMETRY_METRICS_EXPORTER_H_
