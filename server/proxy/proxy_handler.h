#pragma once

#include "net/http_client.h"
#include "net/http_message.h"
#include "server/logging/metrics_sink.h"
#include "server/metrics/metrics.h"
#include "server/proxy/route.h"
#include "stream/chunk.h"
#include "stream/frame_buffer.h"
#include "stream/stream_tee.h"

#include <cstddef>
#include <string>

namespace llmtap {

struct ProxyOptions {
  UpstreamTimeouts timeouts;
  TeeOptions tee;
  std::size_t max_unit_bytes{kDefaultMaxUnitBytes};
};

// Per-request lifecycle: extract the descriptor, forward upstream, stream the
// response back through the tee, then emit one usage record.
class ProxyHandler {
public:
  ProxyHandler(ProxyOptions options, MetricsSink *sink,
               MetricsRegistry *registry = nullptr);

  // Writes the upstream response (or a forwarding error) to `client`. Always
  // emits exactly one record to the sink.
  void Handle(const RequestHead &request, const std::string &body,
              const ProxyRoute &route, ByteSink &client);

  // A proxy request refused before forwarding: answers with the error and
  // emits an error record built from whatever body was received.
  void Reject(const std::string &body, ByteSink &client, int status,
              const std::string &status_text, const std::string &error);

private:
  void SendError(ByteSink &client, int status, const std::string &status_text,
                 const std::string &error);

  ProxyOptions options_;
  UpstreamClient upstream_;
  MetricsSink *sink_;
  MetricsRegistry *registry_;
};

} // namespace llmtap
