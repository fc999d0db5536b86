#include "net/http_client.h"

#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <sstream>
#include <utility>

namespace llmtap {

namespace {

constexpr std::size_t kMaxResponseHead = 64 * 1024;

timeval ToTimeval(std::chrono::milliseconds ms) {
  timeval tv;
  tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
  return tv;
}

// Non-blocking connect bounded by `timeout`. Returns the connected socket in
// blocking mode, or -1 with *timed_out set when the deadline passed.
int ConnectWithTimeout(const addrinfo *rp, std::chrono::milliseconds timeout,
                       bool *timed_out) {
  int sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
  if (sock == -1) {
    return -1;
  }
  int flags = ::fcntl(sock, F_GETFL, 0);
  ::fcntl(sock, F_SETFL, flags | O_NONBLOCK);
  int rc = ::connect(sock, rp->ai_addr, rp->ai_addrlen);
  if (rc != 0 && errno != EINPROGRESS) {
    ::close(sock);
    return -1;
  }
  if (rc != 0) {
    pollfd pfd{};
    pfd.fd = sock;
    pfd.events = POLLOUT;
    int ready = 0;
    do {
      ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (ready < 0 && errno == EINTR);
    if (ready == 0) {
      *timed_out = true;
      ::close(sock);
      return -1;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (ready < 0 ||
        ::getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 ||
        so_error != 0) {
      ::close(sock);
      return -1;
    }
  }
  ::fcntl(sock, F_SETFL, flags);
  return sock;
}

bool IsHopByHop(const std::string &name) {
  static const char *const kDropped[] = {
      "Host",    "Connection",        "Keep-Alive",     "Proxy-Connection",
      "Upgrade", "Transfer-Encoding", "Content-Length", "Expect"};
  for (const char *dropped : kDropped) {
    if (EqualsIgnoreCase(name, dropped)) {
      return true;
    }
  }
  return false;
}

} // namespace

UpstreamConnection::~UpstreamConnection() { Close(); }

UpstreamConnection::UpstreamConnection(UpstreamConnection &&other) noexcept
    : fd_(std::exchange(other.fd_, -1)), timed_out_(other.timed_out_) {}

UpstreamConnection &
UpstreamConnection::operator=(UpstreamConnection &&other) noexcept {
  if (this != &other) {
    Close();
    fd_ = std::exchange(other.fd_, -1);
    timed_out_ = other.timed_out_;
  }
  return *this;
}

bool UpstreamConnection::SendAll(const std::string &payload) {
  const char *send_ptr = payload.data();
  std::size_t send_remaining = payload.size();
  while (send_remaining > 0) {
    ssize_t sent = ::send(fd_, send_ptr, send_remaining, MSG_NOSIGNAL);
    if (sent <= 0) {
      if (sent < 0 && errno == EINTR) {
        continue;
      }
      return false;
    }
    send_ptr += sent;
    send_remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

ssize_t UpstreamConnection::Receive(char *buffer, std::size_t length) {
  while (true) {
    ssize_t received = ::recv(fd_, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    if (received < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      timed_out_ = true;
    }
    return received;
  }
}

void UpstreamConnection::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

UpstreamConnection UpstreamClient::Connect(const std::string &host,
                                       int port) const {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  if (getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints,
                  &result) != 0) {
    throw UpstreamError("failed to resolve host " + host, false);
  }
  int sock = -1;
  bool timed_out = false;
  for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
    sock = ConnectWithTimeout(rp, timeouts_.connect, &timed_out);
    if (sock != -1) {
      break;
    }
  }
  freeaddrinfo(result);
  if (sock == -1) {
    throw UpstreamError(timed_out ? "connect timed out" : "failed to connect",
                        timed_out);
  }
  timeval tv = ToTimeval(timeouts_.read);
  setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  int one = 1;
  setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  return UpstreamConnection(sock);
}

std::string BuildForwardRequest(const RequestHead &request,
                                const std::string &target,
                                const std::string &authority,
                                const std::string &body) {
  std::ostringstream out;
  out << request.method << " " << target << " HTTP/1.1\r\n";
  out << "Host: " << authority << "\r\n";
  for (const auto &header : request.headers) {
    if (IsHopByHop(header.name)) {
      continue;
    }
    out << header.name << ": " << header.value << "\r\n";
  }
  bool has_body = !body.empty() || FindHeader(request.headers, "Content-Length");
  if (has_body) {
    out << "Content-Length: " << body.size() << "\r\n";
  }
  out << "Connection: close\r\n\r\n";
  out << body;
  return out.str();
}

HeadReadStatus ReadResponseHead(UpstreamConnection &conn,
                                UpstreamResponse *out) {
  std::string buffer;
  char chunk[4096];
  while (true) {
    auto head_end = buffer.find("\r\n\r\n");
    if (head_end == std::string::npos) {
      if (buffer.size() > kMaxResponseHead) {
        return HeadReadStatus::kTooLarge;
      }
      ssize_t received = conn.Receive(chunk, sizeof(chunk));
      if (received == 0) {
        return HeadReadStatus::kClosed;
      }
      if (received < 0) {
        return conn.timed_out() ? HeadReadStatus::kTimeout
                                : HeadReadStatus::kClosed;
      }
      buffer.append(chunk, static_cast<std::size_t>(received));
      continue;
    }
    std::string raw_head = buffer.substr(0, head_end + 4);
    ResponseHead head;
    if (!ParseResponseHead(raw_head, &head)) {
      return HeadReadStatus::kMalformed;
    }
    buffer.erase(0, head_end + 4);
    if (head.status >= 100 && head.status < 200 && head.status != 101) {
      continue; // interim response (e.g. 100 Continue)
    }
    out->raw_head = std::move(raw_head);
    out->head = std::move(head);
    out->leftover = std::move(buffer);
    return HeadReadStatus::kOk;
  }
}

UpstreamBodySource::UpstreamBodySource(
    UpstreamConnection &conn, std::string leftover,
    std::optional<std::size_t> content_length, bool chunked,
    std::size_t read_size)
    : conn_(conn), leftover_(std::move(leftover)), remaining_(content_length),
      chunked_(chunked), read_size_(std::max<std::size_t>(1, read_size)) {
  if (chunked_) {
    remaining_.reset();
  }
  if (remaining_ && leftover_.size() > *remaining_) {
    leftover_.resize(*remaining_);
  }
}

void UpstreamBodySource::TrackFraming(const std::string &bytes) {
  if (!chunked_ || framing_.done() || framing_.failed()) {
    return;
  }
  scratch_.clear();
  framing_.Decode(bytes.data(), bytes.size(), &scratch_);
}

ReadStatus UpstreamBodySource::Next(std::string *out) {
  out->clear();
  if (!leftover_.empty()) {
    out->swap(leftover_);
    if (remaining_) {
      *remaining_ -= out->size();
    }
    TrackFraming(*out);
    return ReadStatus::kData;
  }
  if ((remaining_ && *remaining_ == 0) || framing_.done()) {
    return ReadStatus::kEof;
  }
  std::size_t want = remaining_ ? std::min(*remaining_, read_size_) : read_size_;
  out->resize(want);
  ssize_t received = conn_.Receive(&(*out)[0], want);
  if (received < 0) {
    out->clear();
    return ReadStatus::kError;
  }
  if (received == 0) {
    out->clear();
    // Closed before the declared length arrived.
    return remaining_ ? ReadStatus::kError : ReadStatus::kEof;
  }
  out->resize(static_cast<std::size_t>(received));
  if (remaining_) {
    *remaining_ -= out->size();
  }
  TrackFraming(*out);
  return ReadStatus::kData;
}

} // namespace llmtap
