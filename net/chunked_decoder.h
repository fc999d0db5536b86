#pragma once

#include <cstddef>
#include <string>

namespace llmtap {

// Incremental decoder for HTTP/1.1 `Transfer-Encoding: chunked` bodies.
// Accepts arbitrary input splits; emits only payload bytes.
class ChunkedDecoder {
public:
  // Appends decoded payload from `data` to *out. Returns false once the
  // framing is invalid; further input is then ignored.
  bool Decode(const char *data, std::size_t length, std::string *out);

  bool done() const { return state_ == State::kDone; }
  bool failed() const { return state_ == State::kError; }

private:
  enum class State { kSizeLine, kData, kDataEnd, kTrailer, kDone, kError };

  bool FinishSizeLine();

  State state_{State::kSizeLine};
  std::string line_;
  std::size_t remaining_{0};
};

} // namespace llmtap
