#pragma once

#include "net/chunked_decoder.h"
#include "net/http_message.h"
#include "stream/chunk.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

#include <sys/types.h>

namespace llmtap {

struct UpstreamTimeouts {
  std::chrono::milliseconds connect{5000};
  std::chrono::milliseconds read{300000};
};

class UpstreamError : public std::runtime_error {
public:
  UpstreamError(const std::string &message, bool timeout)
      : std::runtime_error(message), timeout_(timeout) {}
  bool timeout() const { return timeout_; }

private:
  bool timeout_;
};

// Owned TCP connection to a backend. Closed on destruction.
class UpstreamConnection {
public:
  UpstreamConnection() = default;
  explicit UpstreamConnection(int fd) : fd_(fd) {}
  ~UpstreamConnection();
  UpstreamConnection(UpstreamConnection &&other) noexcept;
  UpstreamConnection &operator=(UpstreamConnection &&other) noexcept;
  UpstreamConnection(const UpstreamConnection &) = delete;
  UpstreamConnection &operator=(const UpstreamConnection &) = delete;

  bool valid() const { return fd_ >= 0; }
  bool SendAll(const std::string &payload);
  // Bytes read, 0 on EOF, -1 on error or read timeout (see timed_out()).
  ssize_t Receive(char *buffer, std::size_t length);
  void Close();
  bool timed_out() const { return timed_out_; }

private:
  int fd_{-1};
  bool timed_out_{false};
};

class UpstreamClient {
public:
  explicit UpstreamClient(UpstreamTimeouts timeouts = {}) : timeouts_(timeouts) {}

  // Throws UpstreamError when the backend cannot be reached in time.
  UpstreamConnection Connect(const std::string &host, int port) const;

  const UpstreamTimeouts &timeouts() const { return timeouts_; }

private:
  UpstreamTimeouts timeouts_;
};

// Serializes the request forwarded upstream: original method and headers in
// order, except Host (rewritten to `authority`), hop-by-hop headers (dropped),
// Connection (forced to close) and Content-Length (restated for `body`).
std::string BuildForwardRequest(const RequestHead &request,
                                const std::string &target,
                                const std::string &authority,
                                const std::string &body);

enum class HeadReadStatus { kOk, kClosed, kTimeout, kMalformed, kTooLarge };

struct UpstreamResponse {
  std::string raw_head; // verbatim, including the terminating blank line
  ResponseHead head;
  std::string leftover; // body bytes that arrived with the head
};

// Reads one final (non-1xx) response head.
HeadReadStatus ReadResponseHead(UpstreamConnection &conn,
                                UpstreamResponse *out);

// Chunk Source over the response body. Yields the leftover bytes first, then
// socket reads. With a declared length it stops after that many bytes; a
// chunked body stops after its last chunk; otherwise it reads to EOF. Bytes
// are never altered.
class UpstreamBodySource : public ChunkSource {
public:
  UpstreamBodySource(UpstreamConnection &conn, std::string leftover,
                     std::optional<std::size_t> content_length,
                     bool chunked = false, std::size_t read_size = 16 * 1024);

  ReadStatus Next(std::string *out) override;
  bool timed_out() const { return conn_.timed_out(); }

private:
  void TrackFraming(const std::string &bytes);

  UpstreamConnection &conn_;
  std::string leftover_;
  std::optional<std::size_t> remaining_;
  bool chunked_;
  std::size_t read_size_;
  // Only used to find the end of a chunked body.
  ChunkedDecoder framing_;
  std::string scratch_;
};

} // namespace llmtap
