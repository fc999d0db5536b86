#include "server/proxy/proxy_handler.h"

#include "server/logging/logger.h"
#include "server/metrics/metrics_aggregator.h"
#include "server/proxy/format_detector.h"
#include "server/proxy/request_descriptor.h"
#include "stream/response_pipeline.h"

#include <utility>

namespace llmtap {

namespace {

bool HasNoBody(const RequestHead &request, const ResponseHead &head) {
  return EqualsIgnoreCase(request.method, "HEAD") ||
         (head.status >= 100 && head.status < 200) || head.status == 204 ||
         head.status == 304;
}

} // namespace

ProxyHandler::ProxyHandler(ProxyOptions options, MetricsSink *sink,
                           MetricsRegistry *registry)
    : options_(std::move(options)), upstream_(options_.timeouts), sink_(sink),
      registry_(registry) {}

void ProxyHandler::SendError(ByteSink &client, int status,
                             const std::string &status_text,
                             const std::string &error) {
  std::string response = BuildErrorResponse(status, status_text, error);
  if (!client.Write(response.data(), response.size())) {
    log::Debug("proxy", "client gone before error response");
  }
  client.Finish();
}

void ProxyHandler::Reject(const std::string &body, ByteSink &client,
                          int status, const std::string &status_text,
                          const std::string &error) {
  MetricsAggregator aggregator(ExtractRequestDescriptor(body), sink_,
                               registry_);
  log::Debug("proxy", "request rejected before forwarding",
             "status=" + std::to_string(status) + " error=" + error);
  aggregator.Reject();
  SendError(client, status, status_text, error);
}

void ProxyHandler::Handle(const RequestHead &request, const std::string &body,
                          const ProxyRoute &route, ByteSink &client) {
  MetricsAggregator aggregator(ExtractRequestDescriptor(body), sink_,
                               registry_);
  const std::string backend = route.backend.authority();
  log::Debug("proxy", "forwarding request",
             "method=" + request.method + " backend=" + backend +
                 " target=" + route.upstream_target);

  UpstreamConnection conn;
  try {
    conn = upstream_.Connect(route.backend.host, route.backend.port);
  } catch (const UpstreamError &ex) {
    log::Error("proxy", "upstream connect failed",
               "backend=" + backend + " reason=" + ex.what());
    aggregator.Fail();
    if (ex.timeout()) {
      SendError(client, 504, "Gateway Timeout", "upstream_timeout");
    } else {
      SendError(client, 502, "Bad Gateway", "upstream_unavailable");
    }
    return;
  }

  if (!conn.SendAll(BuildForwardRequest(request, route.upstream_target,
                                        backend, body))) {
    log::Error("proxy", "upstream send failed", "backend=" + backend);
    aggregator.Fail();
    SendError(client, 502, "Bad Gateway", "upstream_unavailable");
    return;
  }

  UpstreamResponse response;
  HeadReadStatus head_status = ReadResponseHead(conn, &response);
  if (head_status != HeadReadStatus::kOk) {
    aggregator.Fail();
    if (head_status == HeadReadStatus::kTimeout) {
      log::Error("proxy", "upstream response timed out", "backend=" + backend);
      SendError(client, 504, "Gateway Timeout", "upstream_timeout");
    } else {
      log::Error("proxy", "bad upstream response head", "backend=" + backend);
      SendError(client, 502, "Bad Gateway", "upstream_unavailable");
    }
    return;
  }

  if (HasNoBody(request, response.head)) {
    response.head.chunked = false;
    response.head.content_length = 0;
    response.leftover.clear();
  }

  ParserKind kind = DetectFormat(route.family, response.head.content_type());
  log::Debug("proxy", "upstream responded",
             "status=" + std::to_string(response.head.status) +
                 " parser=" + ParserKindName(kind) +
                 " chunked=" + (response.head.chunked ? "true" : "false"));

  PipelineOptions pipeline;
  pipeline.tee = options_.tee;
  pipeline.max_unit_bytes = options_.max_unit_bytes;
  pipeline.chunked = response.head.chunked;
  pipeline.client_prefix = std::move(response.raw_head);

  UpstreamBodySource source(conn, std::move(response.leftover),
                            response.head.content_length,
                            response.head.chunked);
  PipelineResult result = RunResponsePipeline(source, client, kind, pipeline);
  if (result.upstream_error) {
    log::Error("proxy",
               source.timed_out() ? "upstream read timed out"
                                  : "upstream transfer failed",
               "backend=" + backend);
  }
  aggregator.Complete(result);

  const auto &record = aggregator.record();
  log::Debug("proxy", "request finished",
             "status=" + std::string(UsageStatusName(record->status)) +
                 " bytes=" + std::to_string(result.bytes_forwarded) +
                 " latency_ms=" + std::to_string(record->latency_ms));
}

} // namespace llmtap
