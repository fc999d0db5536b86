#pragma once

#include "stream/chunk.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace llmtap {

// Terminal states are sticky: the first Close() wins.
enum class ChannelState { kOpen, kEof, kError, kTruncated, kCancelled };

const char *ChannelStateName(ChannelState state);

// What Push() does when the queued bytes would exceed the byte budget.
//   kBlock:    wait for the consumer (or for the channel to close).
//   kTruncate: close the channel as kTruncated and drop what is queued.
enum class OverflowPolicy { kBlock, kTruncate };

// Single-producer / single-consumer chunk queue bounded by bytes.
class ChunkChannel {
public:
  enum class PushResult { kAccepted, kTruncated, kClosed };

  // max_bytes == 0 means unbounded.
  ChunkChannel(std::size_t max_bytes, OverflowPolicy policy);

  ChunkChannel(const ChunkChannel &) = delete;
  ChunkChannel &operator=(const ChunkChannel &) = delete;

  PushResult Push(const Chunk &chunk);

  // Blocks until a chunk is available or the channel is closed. kEof and
  // kError still hand out what was queued before the close; kTruncated and
  // kCancelled end immediately.
  std::optional<Chunk> Pop();

  // Returns true if this call moved the channel out of kOpen.
  bool Close(ChannelState state);

  ChannelState state() const;
  bool open() const { return state() == ChannelState::kOpen; }
  std::size_t BufferedBytes() const;
  std::size_t Capacity() const { return max_bytes_; }

private:
  bool WouldOverflow(std::size_t incoming) const;

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<Chunk> queue_;
  std::size_t buffered_bytes_{0};
  const std::size_t max_bytes_;
  const OverflowPolicy policy_;
  ChannelState state_{ChannelState::kOpen};
};

} // namespace llmtap
