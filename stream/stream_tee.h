#pragma once

#include "stream/chunk.h"
#include "stream/chunk_channel.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace llmtap {

struct TeeOptions {
  // Bytes queued for the client before the upstream reader waits for it.
  std::size_t client_buffer_bytes{16 * 1024 * 1024};
  // Bytes queued for the parser before its side is marked truncated.
  std::size_t parser_buffer_bytes{4 * 1024 * 1024};
};

// Duplicates one ordered chunk sequence into two independently paced queues:
// the client side (may apply backpressure to the upstream reader) and the
// parser side (never does; overflow truncates it instead). Chunks are shared
// read-only between both sides and are never inspected here.
class StreamTee {
public:
  explicit StreamTee(const TeeOptions &options = {});

  StreamTee(const StreamTee &) = delete;
  StreamTee &operator=(const StreamTee &) = delete;

  // Producer side. Push() may wait on the client queue only.
  void Push(std::string bytes);
  // Signals end of upstream to both sides; later calls are ignored.
  void Complete(bool upstream_error);

  // Consumer side cancellation. Pending and future chunks for that side are
  // dropped and a producer blocked on it is released.
  void DetachClient();
  void DetachParser();

  ChunkChannel &client() { return client_; }
  ChunkChannel &parser() { return parser_; }

  bool ClientActive() const { return client_.open(); }
  bool ParserActive() const { return parser_.open(); }
  // False once neither side will consume more bytes.
  bool WantsMoreInput() const { return ClientActive() || ParserActive(); }

  bool parser_truncated() const {
    return parser_.state() == ChannelState::kTruncated;
  }
  uint64_t chunks_pushed() const { return next_sequence_; }
  uint64_t bytes_pushed() const { return bytes_pushed_; }

private:
  ChunkChannel client_;
  ChunkChannel parser_;
  uint64_t next_sequence_{0};
  uint64_t bytes_pushed_{0};
  std::atomic<bool> completed_{false};
};

} // namespace llmtap
