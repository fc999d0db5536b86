#include "stream/chunk_channel.h"

namespace llmtap {

const char *ChannelStateName(ChannelState state) {
  switch (state) {
  case ChannelState::kOpen:
    return "open";
  case ChannelState::kEof:
    return "eof";
  case ChannelState::kError:
    return "error";
  case ChannelState::kTruncated:
    return "truncated";
  case ChannelState::kCancelled:
    return "cancelled";
  }
  return "unknown";
}

ChunkChannel::ChunkChannel(std::size_t max_bytes, OverflowPolicy policy)
    : max_bytes_(max_bytes), policy_(policy) {}

bool ChunkChannel::WouldOverflow(std::size_t incoming) const {
  return max_bytes_ > 0 && buffered_bytes_ + incoming > max_bytes_;
}

ChunkChannel::PushResult ChunkChannel::Push(const Chunk &chunk) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (state_ != ChannelState::kOpen) {
    return PushResult::kClosed;
  }
  if (policy_ == OverflowPolicy::kTruncate) {
    if (WouldOverflow(chunk.size())) {
      state_ = ChannelState::kTruncated;
      queue_.clear();
      buffered_bytes_ = 0;
      lock.unlock();
      not_empty_.notify_all();
      return PushResult::kTruncated;
    }
  } else {
    // An oversized chunk is still admitted into an empty queue so a single
    // large read can never wedge the producer.
    not_full_.wait(lock, [&] {
      return state_ != ChannelState::kOpen || queue_.empty() ||
             !WouldOverflow(chunk.size());
    });
    if (state_ != ChannelState::kOpen) {
      return PushResult::kClosed;
    }
  }
  buffered_bytes_ += chunk.size();
  queue_.push_back(chunk);
  lock.unlock();
  not_empty_.notify_one();
  return PushResult::kAccepted;
}

std::optional<Chunk> ChunkChannel::Pop() {
  std::unique_lock<std::mutex> lock(mutex_);
  not_empty_.wait(lock, [&] {
    return !queue_.empty() || state_ != ChannelState::kOpen;
  });
  if (state_ == ChannelState::kTruncated ||
      state_ == ChannelState::kCancelled || queue_.empty()) {
    return std::nullopt;
  }
  Chunk chunk = std::move(queue_.front());
  queue_.pop_front();
  buffered_bytes_ -= chunk.size();
  lock.unlock();
  not_full_.notify_one();
  return chunk;
}

bool ChunkChannel::Close(ChannelState state) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ChannelState::kOpen || state == ChannelState::kOpen) {
      return false;
    }
    state_ = state;
    if (state == ChannelState::kTruncated ||
        state == ChannelState::kCancelled) {
      queue_.clear();
      buffered_bytes_ = 0;
    }
  }
  not_empty_.notify_all();
  not_full_.notify_all();
  return true;
}

ChannelState ChunkChannel::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::size_t ChunkChannel::BufferedBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffered_bytes_;
}

} // namespace llmtap
