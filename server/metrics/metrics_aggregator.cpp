#include "server/metrics/metrics_aggregator.h"

#include "server/logging/logger.h"

#include <exception>
#include <utility>

namespace llmtap {

MetricsAggregator::MetricsAggregator(RequestDescriptor descriptor,
                                     MetricsSink *sink,
                                     MetricsRegistry *registry,
                                     Clock::time_point started)
    : descriptor_(std::move(descriptor)), sink_(sink), registry_(registry),
      started_(started) {}

MetricsAggregator::~MetricsAggregator() {
  if (!emitted_) {
    Emit(UsageStatus::kError, TokenUsage{}, Clock::now());
  }
}

void MetricsAggregator::Complete(const PipelineResult &result) {
  if (emitted_) {
    return;
  }
  UsageStatus status = UsageStatus::kPartial;
  if (result.parse.status == ParseStatus::kComplete) {
    // Usage already seen; a failure after the marker does not undo it.
    status = UsageStatus::kComplete;
  } else if (result.upstream_error) {
    status = UsageStatus::kError;
  }
  if (registry_ != nullptr) {
    if (result.parser_truncated) {
      registry_->RecordParserTruncation();
    }
    if (result.upstream_error) {
      registry_->RecordUpstreamFailure();
    }
    if (result.client_detached) {
      registry_->RecordClientDisconnect();
    }
    registry_->RecordMalformedUnits(result.parse.malformed_units);
    registry_->RecordBytesForwarded(result.bytes_forwarded);
  }
  Emit(status, result.parse.usage,
       result.finalized_at ? *result.finalized_at : Clock::now());
}

void MetricsAggregator::Fail() {
  if (emitted_) {
    return;
  }
  if (registry_ != nullptr) {
    registry_->RecordUpstreamFailure();
  }
  Emit(UsageStatus::kError, TokenUsage{}, Clock::now());
}

void MetricsAggregator::Reject() {
  if (emitted_) {
    return;
  }
  Emit(UsageStatus::kError, TokenUsage{}, Clock::now());
}

void MetricsAggregator::Emit(UsageStatus status, const TokenUsage &usage,
                             Clock::time_point end) {
  UsageRecord record;
  record.model = descriptor_.model;
  record.prompt = descriptor_.prompt;
  record.prompt_tokens = usage.prompt_tokens;
  record.completion_tokens = usage.completion_tokens;
  auto elapsed = end > started_ ? end - started_ : Clock::duration::zero();
  record.latency_ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
  record.timestamp = std::chrono::system_clock::now();
  record.status = status;
  emitted_ = record;

  if (registry_ != nullptr) {
    registry_->RecordRequest(record);
  }
  if (sink_ == nullptr) {
    return;
  }
  try {
    sink_->Emit(record);
  } catch (const std::exception &ex) {
    log::Error("metrics", "usage record emission failed", ex.what());
  }
}

} // namespace llmtap
