#include "server/http/http_server.h"

#include "net/http_message.h"
#include "server/logging/logger.h"
#include "server/proxy/route.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace llmtap {

namespace {

std::string BuildResponse(const std::string &body, int status = 200,
                          const std::string &status_text = "OK",
                          const std::string &content_type =
                              "application/json") {
  return "HTTP/1.1 " + std::to_string(status) + " " + status_text +
         "\r\nContent-Type: " + content_type +
         "\r\nContent-Length: " + std::to_string(body.size()) +
         "\r\nConnection: close\r\n\r\n" + body;
}

} // namespace

// The accepted connection as seen by the proxy: writes go to the client,
// Finish() half-closes so the client sees the end of the response.
class HttpServer::SessionSink : public ByteSink {
public:
  SessionSink(HttpServer *server, ClientSession &session)
      : server_(server), session_(session) {}

  bool Write(const char *data, std::size_t length) override {
    return server_->SendAll(session_, data, length);
  }

  void Finish() override {
    if (session_.ssl) {
      SSL_shutdown(session_.ssl);
    } else if (session_.fd >= 0) {
      ::shutdown(session_.fd, SHUT_WR);
    }
  }

private:
  HttpServer *server_;
  ClientSession &session_;
};

HttpServer::HttpServer(std::string host, int port, std::string upstream_host,
                       ProxyHandler *proxy, MetricsRegistry *metrics,
                       TlsConfig tls_config, int num_workers,
                       int client_timeout_ms)
    : host_(std::move(host)), port_(port),
      upstream_host_(std::move(upstream_host)), proxy_(proxy),
      metrics_(metrics), num_workers_(num_workers > 0 ? num_workers : 16),
      client_timeout_ms_(client_timeout_ms > 0 ? client_timeout_ms : 60000) {
  if (tls_config.enabled) {
    if (tls_config.cert_path.empty() || tls_config.key_path.empty()) {
      log::Warn("http", "TLS enabled without cert/key; falling back to HTTP");
    } else {
      ssl_ctx_ = SSL_CTX_new(TLS_server_method());
      if (!ssl_ctx_) {
        log::Error("http", "Failed to initialize TLS context");
      } else if (SSL_CTX_use_certificate_file(ssl_ctx_,
                                              tls_config.cert_path.c_str(),
                                              SSL_FILETYPE_PEM) <= 0) {
        log::Error("http", "Failed to load TLS certificate",
                   "path=" + tls_config.cert_path);
        SSL_CTX_free(ssl_ctx_);
        ssl_ctx_ = nullptr;
      } else if (SSL_CTX_use_PrivateKey_file(ssl_ctx_,
                                             tls_config.key_path.c_str(),
                                             SSL_FILETYPE_PEM) <= 0) {
        log::Error("http", "Failed to load TLS key",
                   "path=" + tls_config.key_path);
        SSL_CTX_free(ssl_ctx_);
        ssl_ctx_ = nullptr;
      } else {
        tls_enabled_ = true;
        log::Info("http", "TLS enabled", "cert=" + tls_config.cert_path);
      }
    }
  }
}

HttpServer::~HttpServer() {
  Stop();
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

void HttpServer::Start() {
  if (running_) {
    return;
  }
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    throw std::runtime_error(std::string("socket: ") + std::strerror(errno));
  }

  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port_));
  if (::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
    ::close(fd);
    throw std::runtime_error("invalid listen address: " + host_);
  }

  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    std::string reason = std::strerror(errno);
    ::close(fd);
    throw std::runtime_error("bind " + host_ + ":" + std::to_string(port_) +
                             ": " + reason);
  }
  if (::listen(fd, 128) < 0) {
    std::string reason = std::strerror(errno);
    ::close(fd);
    throw std::runtime_error("listen: " + reason);
  }
  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) == 0) {
    port_ = ntohs(addr.sin_port);
  }
  server_fd_.store(fd);

  running_ = true;
  for (int i = 0; i < num_workers_; ++i) {
    workers_.emplace_back(&HttpServer::WorkerLoop, this);
  }
  accept_thread_ = std::thread(&HttpServer::Run, this, fd);
}

void HttpServer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  // Close the listening socket to unblock the accept() call in Run().
  int fd = server_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  queue_cv_.notify_all();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  for (auto &w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();
  // Drain any remaining clients in the queue.
  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!client_queue_.empty()) {
    auto session = std::move(client_queue_.front());
    client_queue_.pop();
    CloseSession(session);
  }
}

void HttpServer::WorkerLoop() {
  while (true) {
    ClientSession session;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock,
                     [this] { return !client_queue_.empty() || !running_; });
      if (!running_ && client_queue_.empty()) {
        return;
      }
      session = std::move(client_queue_.front());
      client_queue_.pop();
    }
    if (session.fd >= 0) {
      try {
        HandleClient(session);
      } catch (const std::exception &ex) {
        log::Error("http", "request handling failed", ex.what());
      }
      CloseSession(session);
    }
  }
}

void HttpServer::Run(int fd) {
  while (running_) {
    sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd =
        ::accept(fd, reinterpret_cast<sockaddr *>(&client_addr), &client_len);
    if (client_fd < 0) {
      if (errno == EINTR && running_) {
        continue;
      }
      break; // Socket closed by Stop() or error.
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    timeval tv{};
    tv.tv_sec = client_timeout_ms_ / 1000;
    tv.tv_usec = (client_timeout_ms_ % 1000) * 1000;
    ::setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    ClientSession session;
    session.fd = client_fd;
    if (tls_enabled_) {
      SSL *ssl = SSL_new(ssl_ctx_);
      if (!ssl) {
        ::close(client_fd);
        continue;
      }
      SSL_set_fd(ssl, client_fd);
      if (SSL_accept(ssl) != 1) {
        log::Debug("http", "TLS handshake failed");
        SSL_free(ssl);
        ::close(client_fd);
        continue;
      }
      session.ssl = ssl;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      client_queue_.push(std::move(session));
    }
    queue_cv_.notify_one();
  }

  // If Stop() hasn't already closed the socket, close it now.
  int expected = fd;
  if (server_fd_.compare_exchange_strong(expected, -1)) {
    ::close(fd);
  }
}

void HttpServer::HandleClient(ClientSession &session) {
  // RAII guard: decrement connections on all exit paths.
  struct ConnectionGuard {
    MetricsRegistry *metrics;
    ~ConnectionGuard() {
      if (metrics) {
        metrics->DecrementConnections();
      }
    }
  } guard{metrics_};
  if (metrics_) {
    metrics_->IncrementConnections();
  }

  constexpr std::size_t kInitialBuf = 4096;
  constexpr std::size_t kMaxRequest = 16 * 1024 * 1024; // 16 MB hard limit
  std::string request;
  std::size_t header_end_pos = std::string::npos;
  std::vector<char> buffer(kInitialBuf);

  // Phase 1: read until the end-of-headers marker.
  while (header_end_pos == std::string::npos) {
    if (request.size() >= kMaxRequest) {
      SendAll(session, BuildErrorResponse(413, "Payload Too Large",
                                          "request_too_large"));
      return;
    }
    ssize_t bytes = Receive(session, buffer.data(), buffer.size());
    if (bytes <= 0) {
      return;
    }
    request.append(buffer.data(), static_cast<std::size_t>(bytes));
    header_end_pos = request.find("\r\n\r\n");
  }

  RequestHead head;
  if (!ParseRequestHead(request.substr(0, header_end_pos + 4), &head)) {
    SendAll(session, BuildErrorResponse(400, "Bad Request", "bad_request"));
    return;
  }
  std::string body = request.substr(header_end_pos + 4);

  ProxyRoute route;
  RouteStatus route_status = ResolveRoute(head.target, upstream_host_, &route);
  SessionSink sink(this, session);
  // Proxy requests refused here still produce their usage record.
  auto reject = [&](int status, const std::string &status_text,
                    const std::string &error) {
    if (proxy_ && route_status != RouteStatus::kNotProxyRoute) {
      proxy_->Reject(body, sink, status, status_text, error);
    } else {
      SendAll(session, BuildErrorResponse(status, status_text, error));
    }
  };

  // Phase 2: read the remaining body bytes by Content-Length.
  auto transfer_encoding = FindHeader(head.headers, "Transfer-Encoding");
  if (transfer_encoding &&
      ToLower(*transfer_encoding).find("chunked") != std::string::npos) {
    reject(411, "Length Required", "length_required");
    return;
  }
  std::size_t content_length = 0;
  if (auto value = FindHeader(head.headers, "Content-Length")) {
    try {
      std::size_t consumed = 0;
      content_length = std::stoull(*value, &consumed);
      if (consumed != value->size() || value->front() == '-') {
        throw std::invalid_argument(*value);
      }
    } catch (const std::exception &) {
      reject(400, "Bad Request", "bad_request");
      return;
    }
  }
  if (content_length > kMaxRequest) {
    reject(413, "Payload Too Large", "request_too_large");
    return;
  }
  auto expect = FindHeader(head.headers, "Expect");
  if (expect && EqualsIgnoreCase(*expect, "100-continue") &&
      body.size() < content_length) {
    SendAll(session, "HTTP/1.1 100 Continue\r\n\r\n");
  }
  while (body.size() < content_length) {
    ssize_t bytes = Receive(session, buffer.data(),
                            std::min(buffer.size(), content_length - body.size()));
    if (bytes <= 0) {
      reject(400, "Bad Request", "incomplete_body");
      return;
    }
    body.append(buffer.data(), static_cast<std::size_t>(bytes));
  }
  body.resize(content_length);

  std::string path = head.target.substr(0, head.target.find('?'));
  if (head.method == "GET" && path == "/healthz") {
    SendAll(session, BuildResponse(json({{"status", "ok"}}).dump()));
    return;
  }
  if (head.method == "GET" && path == "/metrics") {
    std::string text = metrics_ ? metrics_->RenderPrometheus() : std::string();
    SendAll(session, BuildResponse(text, 200, "OK",
                                   "text/plain; version=0.0.4"));
    return;
  }

  switch (route_status) {
  case RouteStatus::kOk:
    break;
  case RouteStatus::kBadPort:
    reject(400, "Bad Request", "invalid_backend_port");
    return;
  case RouteStatus::kNotProxyRoute:
    SendAll(session, BuildErrorResponse(404, "Not Found", "not_found"));
    return;
  }
  if (!proxy_) {
    SendAll(session, BuildErrorResponse(503, "Service Unavailable",
                                        "proxy_unavailable"));
    return;
  }
  proxy_->Handle(head, body, route, sink);
}

bool HttpServer::SendAll(ClientSession &session, const std::string &payload) {
  return SendAll(session, payload.data(), payload.size());
}

bool HttpServer::SendAll(ClientSession &session, const char *data,
                         std::size_t length) {
  std::size_t remaining = length;
  while (remaining > 0) {
    int sent = 0;
    if (session.ssl) {
      // Blocking socket: WANT_WRITE only surfaces when the send timeout hit.
      sent = SSL_write(session.ssl, data, static_cast<int>(remaining));
      if (sent <= 0) {
        return false;
      }
    } else {
      sent = static_cast<int>(::send(session.fd, data, remaining, MSG_NOSIGNAL));
      if (sent <= 0) {
        if (sent < 0 && errno == EINTR) {
          continue;
        }
        return false;
      }
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

ssize_t HttpServer::Receive(ClientSession &session, char *buffer,
                            std::size_t length) {
  if (session.ssl) {
    int received = SSL_read(session.ssl, buffer, static_cast<int>(length));
    if (received > 0) {
      return received;
    }
    return SSL_get_error(session.ssl, received) == SSL_ERROR_ZERO_RETURN ? 0
                                                                          : -1;
  }
  while (true) {
    ssize_t received = ::recv(session.fd, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

void HttpServer::CloseSession(ClientSession &session) {
  if (session.ssl) {
    SSL_shutdown(session.ssl);
    SSL_free(session.ssl);
    session.ssl = nullptr;
  }
  if (session.fd >= 0) {
    ::close(session.fd);
    session.fd = -1;
  }
}

} // namespace llmtap
