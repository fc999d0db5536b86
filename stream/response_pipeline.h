#pragma once

#include "stream/chunk.h"
#include "stream/frame_buffer.h"
#include "stream/parse_outcome.h"
#include "stream/stream_parser.h"
#include "stream/stream_tee.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace llmtap {

struct PipelineOptions {
  TeeOptions tee;
  std::size_t max_unit_bytes{kDefaultMaxUnitBytes};
  // Body uses Transfer-Encoding: chunked. Only the parser side decodes it.
  bool chunked{false};
  // Written to the client before any body byte (the upstream response head).
  std::string client_prefix;
};

struct PipelineResult {
  ParseOutcome parse;
  bool upstream_error{false};
  bool client_detached{false};
  bool parser_truncated{false};
  uint64_t bytes_forwarded{0};
  // When the parser saw its completion marker.
  std::optional<std::chrono::steady_clock::time_point> finalized_at;
};

// Drives one response body from `source` to `client` while the selected parser
// consumes the same bytes on its own thread. Returns after the source ended
// (or nobody wants more bytes) and both consumers have stopped.
PipelineResult RunResponsePipeline(ChunkSource &source, ByteSink &client,
                                   ParserKind kind,
                                   const PipelineOptions &options = {});

} // namespace llmtap
