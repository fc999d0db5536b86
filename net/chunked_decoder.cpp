#include "net/chunked_decoder.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace llmtap {

namespace {

constexpr std::size_t kMaxLineBytes = 4096;

} // namespace

bool ChunkedDecoder::FinishSizeLine() {
  std::string size_text = line_;
  line_.clear();
  auto semi = size_text.find(';');
  if (semi != std::string::npos) {
    size_text.resize(semi);
  }
  auto start = size_text.find_first_not_of(" \t\r");
  auto end = size_text.find_last_not_of(" \t\r");
  if (start == std::string::npos) {
    return false;
  }
  size_text = size_text.substr(start, end - start + 1);
  for (unsigned char c : size_text) {
    if (!std::isxdigit(c)) {
      return false;
    }
  }
  errno = 0;
  unsigned long long size = std::strtoull(size_text.c_str(), nullptr, 16);
  if (errno == ERANGE) {
    return false;
  }
  remaining_ = static_cast<std::size_t>(size);
  state_ = remaining_ == 0 ? State::kTrailer : State::kData;
  return true;
}

bool ChunkedDecoder::Decode(const char *data, std::size_t length,
                            std::string *out) {
  std::size_t pos = 0;
  while (pos < length) {
    switch (state_) {
    case State::kSizeLine:
    case State::kTrailer: {
      char c = data[pos++];
      if (c != '\n') {
        line_.push_back(c);
        if (line_.size() > kMaxLineBytes) {
          state_ = State::kError;
          return false;
        }
        break;
      }
      if (state_ == State::kSizeLine) {
        if (!FinishSizeLine()) {
          state_ = State::kError;
          return false;
        }
      } else {
        bool blank = line_.empty() || line_ == "\r";
        line_.clear();
        if (blank) {
          state_ = State::kDone;
        }
      }
      break;
    }
    case State::kData: {
      std::size_t take = std::min(remaining_, length - pos);
      out->append(data + pos, take);
      pos += take;
      remaining_ -= take;
      if (remaining_ == 0) {
        state_ = State::kDataEnd;
      }
      break;
    }
    case State::kDataEnd: {
      char c = data[pos++];
      if (c == '\n') {
        state_ = State::kSizeLine;
      } else if (c != '\r') {
        state_ = State::kError;
        return false;
      }
      break;
    }
    case State::kDone:
      // Bytes after the terminal chunk are not part of the body.
      return true;
    case State::kError:
      return false;
    }
  }
  return state_ != State::kError;
}

} // namespace llmtap
