#pragma once

#include "server/metrics/usage_record.h"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace llmtap {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds: 10, 50, 100, 250, 500, 1000, 2500, 5000, +Inf
  static constexpr std::array<double, 8> kBuckets{
      10.0, 50.0, 100.0, 250.0, 500.0, 1000.0, 2500.0, 5000.0};
  std::array<std::atomic<uint64_t>, 9> counts{}; // 8 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

// In-process operational counters, rendered on GET /metrics.
class MetricsRegistry {
public:
  // One call per emitted usage record.
  void RecordRequest(const UsageRecord &record);
  void RecordParserTruncation();
  void RecordMalformedUnits(std::size_t count);
  void RecordUpstreamFailure();
  void RecordClientDisconnect();
  void RecordBytesForwarded(uint64_t bytes);

  // Gauge helpers.
  void IncrementConnections();
  void DecrementConnections();

  uint64_t RequestCount(UsageStatus status) const;
  int ActiveConnections() const { return active_connections_.load(); }

  std::string RenderPrometheus() const;

private:
  std::atomic<uint64_t> requests_complete_{0};
  std::atomic<uint64_t> requests_partial_{0};
  std::atomic<uint64_t> requests_error_{0};
  std::atomic<uint64_t> prompt_tokens_{0};
  std::atomic<uint64_t> completion_tokens_{0};
  std::atomic<uint64_t> parser_truncations_{0};
  std::atomic<uint64_t> malformed_units_{0};
  std::atomic<uint64_t> upstream_failures_{0};
  std::atomic<uint64_t> client_disconnects_{0};
  std::atomic<uint64_t> bytes_forwarded_{0};

  LatencyHistogram request_latency_;

  std::atomic<int> active_connections_{0};
};

} // namespace llmtap
