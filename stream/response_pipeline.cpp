#include "stream/response_pipeline.h"

#include "net/chunked_decoder.h"
#include "server/logging/logger.h"

#include <exception>
#include <functional>
#include <thread>

namespace llmtap {

namespace {

struct ClientSideResult {
  bool detached{false};
  uint64_t bytes_forwarded{0};
};

void DrainClient(StreamTee &tee, ByteSink &client, const std::string &prefix,
                 ClientSideResult *result) {
  try {
    bool ok = prefix.empty() || client.Write(prefix.data(), prefix.size());
    while (ok) {
      auto chunk = tee.client().Pop();
      if (!chunk) {
        break;
      }
      if (!client.Write(chunk->data->data(), chunk->size())) {
        ok = false;
        break;
      }
      result->bytes_forwarded += chunk->size();
    }
    if (!ok) {
      log::Debug("pipeline", "client went away, forwarding stopped");
      result->detached = true;
      tee.DetachClient();
    }
  } catch (const std::exception &ex) {
    log::Error("pipeline", "client writer failed", ex.what());
    result->detached = true;
    tee.DetachClient();
  }
  client.Finish();
}

struct ParserSideResult {
  ParseOutcome outcome;
  bool incomplete_framing{false};
  std::optional<std::chrono::steady_clock::time_point> finalized_at;
};

void DrainParser(StreamTee &tee, ParserKind kind,
                 const PipelineOptions &options, ParserSideResult *result) {
  StreamParser parser(kind, options.max_unit_bytes);
  ChunkedDecoder decoder;
  std::string decoded;
  bool framing_failed = false;
  try {
    while (auto chunk = tee.parser().Pop()) {
      if (options.chunked) {
        decoded.clear();
        if (!decoder.Decode(chunk->data->data(), chunk->size(), &decoded)) {
          log::Warn("pipeline", "invalid chunked framing, parser stopped",
                    "sequence=" + std::to_string(chunk->sequence));
          framing_failed = true;
        }
        parser.Feed(decoded.data(), decoded.size());
      } else {
        parser.Feed(chunk->data->data(), chunk->size());
      }
      if (parser.finalized()) {
        result->finalized_at = std::chrono::steady_clock::now();
        tee.DetachParser();
        break;
      }
      if (framing_failed) {
        tee.DetachParser();
        break;
      }
    }
  } catch (const std::exception &ex) {
    log::Error("pipeline", "parser task failed", ex.what());
    tee.parser().Close(ChannelState::kError);
    framing_failed = true;
  }

  StreamEnd end = StreamEnd::kClean;
  switch (tee.parser().state()) {
  case ChannelState::kTruncated:
    end = StreamEnd::kTruncated;
    break;
  case ChannelState::kError:
    end = StreamEnd::kAborted;
    break;
  default:
    break;
  }
  if (framing_failed) {
    end = StreamEnd::kAborted;
  } else if (end == StreamEnd::kClean && options.chunked && !decoder.done() &&
             !parser.finalized()) {
    // Upstream closed before the terminating zero-size chunk.
    result->incomplete_framing = true;
    end = StreamEnd::kAborted;
  }
  result->outcome = parser.Finish(end);
}

} // namespace

PipelineResult RunResponsePipeline(ChunkSource &source, ByteSink &client,
                                   ParserKind kind,
                                   const PipelineOptions &options) {
  StreamTee tee(options.tee);
  ClientSideResult client_result;
  ParserSideResult parser_result;

  std::thread writer(DrainClient, std::ref(tee), std::ref(client),
                     std::cref(options.client_prefix), &client_result);
  std::thread parser(DrainParser, std::ref(tee), kind, std::cref(options),
                     &parser_result);

  bool upstream_error = false;
  std::string buffer;
  try {
    while (tee.WantsMoreInput()) {
      ReadStatus status = source.Next(&buffer);
      if (status == ReadStatus::kData) {
        tee.Push(std::move(buffer));
        buffer.clear();
        continue;
      }
      upstream_error = status == ReadStatus::kError;
      break;
    }
  } catch (const std::exception &ex) {
    log::Error("pipeline", "upstream reader failed", ex.what());
    upstream_error = true;
  }
  tee.Complete(upstream_error);

  writer.join();
  parser.join();

  PipelineResult result;
  result.parse = parser_result.outcome;
  result.upstream_error = upstream_error || parser_result.incomplete_framing;
  result.client_detached = client_result.detached;
  result.parser_truncated = tee.parser_truncated();
  result.bytes_forwarded = client_result.bytes_forwarded;
  result.finalized_at = parser_result.finalized_at;
  if (result.upstream_error) {
    log::Warn("pipeline", "upstream stream ended abnormally",
              "bytes=" + std::to_string(tee.bytes_pushed()));
  }
  return result;
}

} // namespace llmtap
