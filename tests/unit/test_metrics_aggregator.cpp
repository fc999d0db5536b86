#include <catch2/catch.hpp>

#include "server/metrics/metrics_aggregator.h"

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace {

class CapturingSink : public llmtap::MetricsSink {
public:
  void Emit(const llmtap::UsageRecord &record) override {
    std::lock_guard<std::mutex> lock(mutex);
    records.push_back(record);
  }
  std::mutex mutex;
  std::vector<llmtap::UsageRecord> records;
};

class ThrowingSink : public llmtap::MetricsSink {
public:
  void Emit(const llmtap::UsageRecord &) override {
    throw std::runtime_error("disk full");
  }
};

llmtap::RequestDescriptor Descriptor() {
  llmtap::RequestDescriptor descriptor;
  descriptor.model = "llama3";
  descriptor.prompt = "hi";
  return descriptor;
}

llmtap::PipelineResult CompleteResult(uint64_t prompt, uint64_t completion) {
  llmtap::PipelineResult result;
  result.parse.status = llmtap::ParseStatus::kComplete;
  result.parse.usage.prompt_tokens = prompt;
  result.parse.usage.completion_tokens = completion;
  return result;
}

} // namespace

TEST_CASE("MetricsAggregator emits a complete record", "[metrics_aggregator]") {
  CapturingSink sink;
  {
    llmtap::MetricsAggregator aggregator(Descriptor(), &sink);
    aggregator.Complete(CompleteResult(8, 150));
    REQUIRE(aggregator.emitted());
  }
  REQUIRE(sink.records.size() == 1);
  const auto &record = sink.records.front();
  REQUIRE(record.model == "llama3");
  REQUIRE(record.prompt == "hi");
  REQUIRE(record.prompt_tokens == 8u);
  REQUIRE(record.completion_tokens == 150u);
  REQUIRE(record.status == llmtap::UsageStatus::kComplete);
}

TEST_CASE("MetricsAggregator maps partial and error outcomes",
          "[metrics_aggregator]") {
  CapturingSink sink;
  {
    llmtap::MetricsAggregator partial(Descriptor(), &sink);
    llmtap::PipelineResult truncated;
    truncated.parser_truncated = true;
    truncated.parse.truncated = true;
    partial.Complete(truncated);

    llmtap::MetricsAggregator failed(Descriptor(), &sink);
    llmtap::PipelineResult upstream;
    upstream.upstream_error = true;
    failed.Complete(upstream);
  }
  REQUIRE(sink.records.size() == 2);
  REQUIRE(sink.records[0].status == llmtap::UsageStatus::kPartial);
  REQUIRE_FALSE(sink.records[0].prompt_tokens.has_value());
  REQUIRE(sink.records[1].status == llmtap::UsageStatus::kError);
}

TEST_CASE("MetricsAggregator keeps usage seen before an upstream failure",
          "[metrics_aggregator]") {
  CapturingSink sink;
  llmtap::MetricsAggregator aggregator(Descriptor(), &sink);
  auto result = CompleteResult(1, 2);
  result.upstream_error = true;
  aggregator.Complete(result);
  REQUIRE(sink.records.front().status == llmtap::UsageStatus::kComplete);
}

TEST_CASE("MetricsAggregator emits exactly once", "[metrics_aggregator]") {
  CapturingSink sink;
  {
    llmtap::MetricsAggregator aggregator(Descriptor(), &sink);
    aggregator.Complete(CompleteResult(1, 1));
    aggregator.Complete(CompleteResult(2, 2));
    aggregator.Fail();
  }
  REQUIRE(sink.records.size() == 1);
  REQUIRE(sink.records.front().prompt_tokens == 1u);
}

TEST_CASE("MetricsAggregator failure record has no counts",
          "[metrics_aggregator]") {
  CapturingSink sink;
  llmtap::MetricsAggregator aggregator(Descriptor(), &sink);
  aggregator.Fail();
  REQUIRE(sink.records.size() == 1);
  REQUIRE(sink.records.front().status == llmtap::UsageStatus::kError);
  REQUIRE_FALSE(sink.records.front().completion_tokens.has_value());
}

TEST_CASE("MetricsAggregator abandoned request still emits an error",
          "[metrics_aggregator]") {
  CapturingSink sink;
  { llmtap::MetricsAggregator aggregator(Descriptor(), &sink); }
  REQUIRE(sink.records.size() == 1);
  REQUIRE(sink.records.front().status == llmtap::UsageStatus::kError);
}

TEST_CASE("MetricsAggregator measures latency at the completion marker",
          "[metrics_aggregator]") {
  CapturingSink sink;
  auto start = std::chrono::steady_clock::now() - std::chrono::seconds(10);
  llmtap::MetricsAggregator aggregator(Descriptor(), &sink, nullptr, start);
  auto result = CompleteResult(1, 1);
  result.finalized_at = start + std::chrono::milliseconds(250);
  aggregator.Complete(result);
  REQUIRE(sink.records.front().latency_ms == 250u);
}

TEST_CASE("MetricsAggregator swallows sink failures", "[metrics_aggregator]") {
  ThrowingSink sink;
  llmtap::MetricsAggregator aggregator(Descriptor(), &sink);
  REQUIRE_NOTHROW(aggregator.Complete(CompleteResult(1, 1)));
  REQUIRE(aggregator.emitted());
}

TEST_CASE("MetricsAggregator updates the registry", "[metrics_aggregator]") {
  CapturingSink sink;
  llmtap::MetricsRegistry registry;
  {
    llmtap::MetricsAggregator ok(Descriptor(), &sink, &registry);
    ok.Complete(CompleteResult(3, 4));
    llmtap::MetricsAggregator failed(Descriptor(), &sink, &registry);
    failed.Fail();
  }
  REQUIRE(registry.RequestCount(llmtap::UsageStatus::kComplete) == 1);
  REQUIRE(registry.RequestCount(llmtap::UsageStatus::kError) == 1);
  std::string text = registry.RenderPrometheus();
  REQUIRE(text.find("llmtap_prompt_tokens_total 3") != std::string::npos);
  REQUIRE(text.find("llmtap_upstream_failures_total 1") != std::string::npos);
}

TEST_CASE("MetricsAggregator rejected request is an error without an upstream "
          "failure",
          "[metrics_aggregator]") {
  CapturingSink sink;
  llmtap::MetricsRegistry registry;
  {
    llmtap::MetricsAggregator rejected(Descriptor(), &sink, &registry);
    rejected.Reject();
    rejected.Fail();
  }
  REQUIRE(sink.records.size() == 1);
  REQUIRE(sink.records.front().status == llmtap::UsageStatus::kError);
  REQUIRE(sink.records.front().model == "llama3");
  REQUIRE(registry.RequestCount(llmtap::UsageStatus::kError) == 1);
  std::string text = registry.RenderPrometheus();
  REQUIRE(text.find("llmtap_upstream_failures_total 0") != std::string::npos);
}
