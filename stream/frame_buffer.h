#pragma once

#include <cstddef>
#include <string>

namespace llmtap {

constexpr std::size_t kDefaultMaxUnitBytes = 1024 * 1024;

// Accumulates stream bytes and hands out delimiter-terminated units. Only the
// bytes after the last complete delimiter are retained, and a unit that grows
// past max_unit_bytes without a delimiter is dropped (counted, then skipped up
// to the next delimiter) so the buffer stays bounded.
class FrameBuffer {
public:
  FrameBuffer(std::string delimiter, std::size_t max_unit_bytes);

  void Append(const char *data, std::size_t length);

  // Moves the next complete unit (delimiter excluded) into *unit.
  bool NextUnit(std::string *unit);

  // Returns and clears the undelimited remainder. Empty while a dropped unit
  // is being skipped.
  std::string TakeTail();

  std::size_t TailSize() const { return buffer_.size() - read_pos_; }
  std::size_t dropped_units() const { return dropped_units_; }

private:
  void Compact();

  const std::string delimiter_;
  const std::size_t max_unit_bytes_;
  std::string buffer_;
  std::size_t read_pos_{0}; // start of the first unconsumed unit
  std::size_t scan_pos_{0}; // where the next delimiter search resumes
  bool discarding_{false};
  std::size_t dropped_units_{0};
};

} // namespace llmtap
