#pragma once

#include "server/logging/metrics_sink.h"
#include "server/metrics/metrics.h"
#include "server/metrics/usage_record.h"
#include "server/proxy/request_descriptor.h"
#include "stream/response_pipeline.h"

#include <chrono>
#include <optional>

namespace llmtap {

// Owns the usage record of one request. Exactly one record reaches the sink:
// the first Complete(), Fail() or Reject() call emits it, later calls are ignored, and a
// request that ends without either emits an error record on destruction.
class MetricsAggregator {
public:
  using Clock = std::chrono::steady_clock;

  MetricsAggregator(RequestDescriptor descriptor, MetricsSink *sink,
                    MetricsRegistry *registry = nullptr,
                    Clock::time_point started = Clock::now());
  ~MetricsAggregator();

  MetricsAggregator(const MetricsAggregator &) = delete;
  MetricsAggregator &operator=(const MetricsAggregator &) = delete;

  // The response stream ended. Latency is taken at the parser's completion
  // marker when it saw one, else now.
  void Complete(const PipelineResult &result);
  // The request failed before a response stream existed.
  void Fail();
  // The request was refused before anything was sent upstream.
  void Reject();

  bool emitted() const { return emitted_.has_value(); }
  const std::optional<UsageRecord> &record() const { return emitted_; }

private:
  void Emit(UsageStatus status, const TokenUsage &usage, Clock::time_point end);

  RequestDescriptor descriptor_;
  MetricsSink *sink_;
  MetricsRegistry *registry_;
  Clock::time_point started_;
  std::optional<UsageRecord> emitted_;
};

} // namespace llmtap
