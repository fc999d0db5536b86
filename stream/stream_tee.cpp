#include "stream/stream_tee.h"

#include "server/logging/logger.h"

#include <utility>

namespace llmtap {

StreamTee::StreamTee(const TeeOptions &options)
    : client_(options.client_buffer_bytes, OverflowPolicy::kBlock),
      parser_(options.parser_buffer_bytes, OverflowPolicy::kTruncate) {}

void StreamTee::Push(std::string bytes) {
  if (bytes.empty()) {
    return;
  }
  bytes_pushed_ += bytes.size();
  Chunk chunk = MakeChunk(std::move(bytes), next_sequence_++);
  // Parser first: its push never waits, so a stalled client cannot starve it.
  if (parser_.Push(chunk) == ChunkChannel::PushResult::kTruncated) {
    log::Warn("tee", "parser queue overflow, metrics for this stream will be "
                     "partial",
              "limit_bytes=" + std::to_string(parser_.Capacity()));
  }
  client_.Push(chunk);
}

void StreamTee::Complete(bool upstream_error) {
  if (completed_.exchange(true)) {
    return;
  }
  ChannelState end = upstream_error ? ChannelState::kError : ChannelState::kEof;
  client_.Close(end);
  parser_.Close(end);
}

void StreamTee::DetachClient() { client_.Close(ChannelState::kCancelled); }

void StreamTee::DetachParser() { parser_.Close(ChannelState::kCancelled); }

} // namespace llmtap
