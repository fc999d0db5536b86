#include "server/metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace llmtap {

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)),
                   std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordRequest(const UsageRecord &record) {
  switch (record.status) {
  case UsageStatus::kComplete:
    requests_complete_.fetch_add(1, std::memory_order_relaxed);
    break;
  case UsageStatus::kPartial:
    requests_partial_.fetch_add(1, std::memory_order_relaxed);
    break;
  case UsageStatus::kError:
    requests_error_.fetch_add(1, std::memory_order_relaxed);
    break;
  }
  if (record.prompt_tokens) {
    prompt_tokens_.fetch_add(*record.prompt_tokens, std::memory_order_relaxed);
  }
  if (record.completion_tokens) {
    completion_tokens_.fetch_add(*record.completion_tokens,
                                 std::memory_order_relaxed);
  }
  request_latency_.Record(static_cast<double>(record.latency_ms));
}

void MetricsRegistry::RecordParserTruncation() {
  parser_truncations_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordMalformedUnits(std::size_t count) {
  if (count == 0) {
    return;
  }
  malformed_units_.fetch_add(count, std::memory_order_relaxed);
}

void MetricsRegistry::RecordUpstreamFailure() {
  upstream_failures_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordClientDisconnect() {
  client_disconnects_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordBytesForwarded(uint64_t bytes) {
  bytes_forwarded_.fetch_add(bytes, std::memory_order_relaxed);
}

void MetricsRegistry::IncrementConnections() {
  active_connections_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::DecrementConnections() {
  active_connections_.fetch_sub(1, std::memory_order_relaxed);
}

uint64_t MetricsRegistry::RequestCount(UsageStatus status) const {
  switch (status) {
  case UsageStatus::kComplete:
    return requests_complete_.load();
  case UsageStatus::kPartial:
    return requests_partial_.load();
  case UsageStatus::kError:
    return requests_error_.load();
  }
  return 0;
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::ostringstream out;

  // --- Counters ---
  out << "# HELP llmtap_requests_total Proxied requests by usage record status\n";
  out << "# TYPE llmtap_requests_total counter\n";
  out << "llmtap_requests_total{status=\"complete\"} "
      << requests_complete_.load() << "\n";
  out << "llmtap_requests_total{status=\"partial\"} "
      << requests_partial_.load() << "\n";
  out << "llmtap_requests_total{status=\"error\"} " << requests_error_.load()
      << "\n";

  out << "# HELP llmtap_prompt_tokens_total Prompt tokens reported by backends\n";
  out << "# TYPE llmtap_prompt_tokens_total counter\n";
  out << "llmtap_prompt_tokens_total " << prompt_tokens_.load() << "\n";

  out << "# HELP llmtap_completion_tokens_total Completion tokens reported by backends\n";
  out << "# TYPE llmtap_completion_tokens_total counter\n";
  out << "llmtap_completion_tokens_total " << completion_tokens_.load() << "\n";

  out << "# HELP llmtap_parser_truncations_total Responses whose parser side overflowed its buffer\n";
  out << "# TYPE llmtap_parser_truncations_total counter\n";
  out << "llmtap_parser_truncations_total " << parser_truncations_.load()
      << "\n";

  out << "# HELP llmtap_malformed_units_total Discarded NDJSON lines and SSE events\n";
  out << "# TYPE llmtap_malformed_units_total counter\n";
  out << "llmtap_malformed_units_total " << malformed_units_.load() << "\n";

  out << "# HELP llmtap_upstream_failures_total Upstream connect, timeout and transfer failures\n";
  out << "# TYPE llmtap_upstream_failures_total counter\n";
  out << "llmtap_upstream_failures_total " << upstream_failures_.load() << "\n";

  out << "# HELP llmtap_client_disconnects_total Clients that left before the response ended\n";
  out << "# TYPE llmtap_client_disconnects_total counter\n";
  out << "llmtap_client_disconnects_total " << client_disconnects_.load()
      << "\n";

  out << "# HELP llmtap_bytes_forwarded_total Response body bytes written to clients\n";
  out << "# TYPE llmtap_bytes_forwarded_total counter\n";
  out << "llmtap_bytes_forwarded_total " << bytes_forwarded_.load() << "\n";

  // --- Request latency histogram ---
  out << "# HELP llmtap_request_duration_ms Request latency until the usage record was final\n";
  out << "# TYPE llmtap_request_duration_ms histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << "llmtap_request_duration_ms_bucket{le=\"" << std::fixed
        << std::setprecision(0) << LatencyHistogram::kBuckets[i] << "\"} "
        << request_latency_.counts[i].load() << "\n";
  }
  out << "llmtap_request_duration_ms_bucket{le=\"+Inf\"} "
      << request_latency_.counts[LatencyHistogram::kBuckets.size()].load()
      << "\n";
  out << "llmtap_request_duration_ms_sum " << request_latency_.sum_ms.load()
      << "\n";
  out << "llmtap_request_duration_ms_count " << request_latency_.total.load()
      << "\n";

  // --- Gauges ---
  out << "# HELP llmtap_active_connections Current number of active HTTP connections\n";
  out << "# TYPE llmtap_active_connections gauge\n";
  out << "llmtap_active_connections " << active_connections_.load() << "\n";

  return out.str();
}

} // namespace llmtap
