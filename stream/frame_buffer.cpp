#include "stream/frame_buffer.h"

#include <algorithm>
#include <utility>

namespace llmtap {

FrameBuffer::FrameBuffer(std::string delimiter, std::size_t max_unit_bytes)
    : delimiter_(std::move(delimiter)),
      max_unit_bytes_(std::max<std::size_t>(1, max_unit_bytes)) {}

void FrameBuffer::Append(const char *data, std::size_t length) {
  buffer_.append(data, length);
}

bool FrameBuffer::NextUnit(std::string *unit) {
  while (true) {
    auto pos = buffer_.find(delimiter_, scan_pos_);
    if (pos == std::string::npos) {
      // A delimiter may straddle the next Append(); rescan its possible prefix.
      std::size_t overlap = delimiter_.size() - 1;
      scan_pos_ = std::max(read_pos_, buffer_.size() > overlap
                                          ? buffer_.size() - overlap
                                          : std::size_t{0});
      Compact();
      if (buffer_.size() > max_unit_bytes_) {
        if (!discarding_) {
          discarding_ = true;
          ++dropped_units_;
        }
        std::size_t keep = std::min(overlap, buffer_.size());
        buffer_.erase(0, buffer_.size() - keep);
        scan_pos_ = 0;
      }
      return false;
    }
    std::size_t start = read_pos_;
    read_pos_ = pos + delimiter_.size();
    scan_pos_ = read_pos_;
    if (discarding_) {
      discarding_ = false;
      continue;
    }
    if (pos - start > max_unit_bytes_) {
      // Arrived whole in one append; drop it like a streamed oversize unit.
      ++dropped_units_;
      continue;
    }
    unit->assign(buffer_, start, pos - start);
    return true;
  }
}

std::string FrameBuffer::TakeTail() {
  Compact();
  std::string tail;
  if (!discarding_) {
    tail.swap(buffer_);
  }
  buffer_.clear();
  scan_pos_ = 0;
  discarding_ = false;
  return tail;
}

void FrameBuffer::Compact() {
  if (read_pos_ == 0) {
    return;
  }
  buffer_.erase(0, read_pos_);
  scan_pos_ -= std::min(scan_pos_, read_pos_);
  read_pos_ = 0;
}

} // namespace llmtap
