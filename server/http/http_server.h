#pragma once

#include "server/metrics/metrics.h"
#include "server/proxy/proxy_handler.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include <openssl/ssl.h>

namespace llmtap {

class HttpServer {
public:
  struct TlsConfig {
    bool enabled{false};
    std::string cert_path;
    std::string key_path;
  };

  // `proxy` serves /proxy/...; `metrics` backs /metrics and may be null.
  // `client_timeout_ms` bounds each blocking send or receive on an accepted
  // connection; a client that stops reading is treated as gone.
  HttpServer(std::string host, int port, std::string upstream_host,
             ProxyHandler *proxy, MetricsRegistry *metrics,
             TlsConfig tls_config, int num_workers = 16,
             int client_timeout_ms = 60000);
  ~HttpServer();

  // Binds and starts accepting. Throws std::runtime_error when the listener
  // cannot be bound. Port 0 picks a free port (see port()).
  void Start();
  void Stop();
  int port() const { return port_; }

private:
  struct ClientSession {
    int fd{-1};
    SSL *ssl{nullptr};
  };

  class SessionSink;

  void Run(int fd);
  void WorkerLoop();
  void HandleClient(ClientSession &session);

  bool SendAll(ClientSession &session, const std::string &payload);
  bool SendAll(ClientSession &session, const char *data, std::size_t length);
  ssize_t Receive(ClientSession &session, char *buffer, std::size_t length);
  void CloseSession(ClientSession &session);

  std::string host_;
  int port_;
  std::string upstream_host_;
  ProxyHandler *proxy_;
  MetricsRegistry *metrics_;
  bool tls_enabled_{false};
  SSL_CTX *ssl_ctx_{nullptr};
  std::atomic<bool> running_{false};
  std::atomic<int> server_fd_{-1};
  int num_workers_;
  int client_timeout_ms_;
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::queue<ClientSession> client_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
};

} // namespace llmtap
