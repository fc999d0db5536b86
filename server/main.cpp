#include "server/config/proxy_config.h"
#include "server/http/http_server.h"
#include "server/logging/logger.h"
#include "server/logging/metrics_sink.h"
#include "server/metrics/metrics.h"
#include "server/proxy/proxy_handler.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>

static std::atomic<bool> g_running{true};

void SignalHandler(int) { g_running = false; }

int main(int argc, char **argv) {
  llmtap::ProxyConfig config;
  try {
    config = llmtap::LoadProxyConfig(argc, argv);
  } catch (const llmtap::ConfigError &e) {
    std::cerr << "llmtap: " << e.what() << std::endl;
    return 1;
  }

  llmtap::log::SetJsonMode(config.json_logs);
  llmtap::log::SetLevel(config.log_level);

  llmtap::MetricsRegistry metrics;
  llmtap::JsonLineSink sink(config.metrics_file, config.redact_prompts);

  llmtap::ProxyOptions options;
  options.timeouts.connect = std::chrono::milliseconds(config.connect_timeout_ms);
  options.timeouts.read = std::chrono::milliseconds(config.read_timeout_ms);
  options.tee.parser_buffer_bytes = config.parser_buffer_bytes;
  options.tee.client_buffer_bytes = config.client_buffer_bytes;
  options.max_unit_bytes = config.max_unit_bytes;
  llmtap::ProxyHandler proxy(options, &sink, &metrics);

  llmtap::HttpServer::TlsConfig tls_config;
  tls_config.enabled = config.tls.enabled;
  tls_config.cert_path = config.tls.cert_path;
  tls_config.key_path = config.tls.key_path;
  llmtap::HttpServer server(config.host, config.port, config.upstream_host,
                            &proxy, &metrics, tls_config, config.workers,
                            config.client_timeout_ms);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  std::signal(SIGPIPE, SIG_IGN);

  try {
    server.Start();
  } catch (const std::runtime_error &e) {
    llmtap::log::Error("server", "failed to start listener", e.what());
    return 1;
  }
  llmtap::log::Info("server", "llmtap listening",
                    "address=" + config.host + ":" +
                        std::to_string(server.port()) +
                        " upstream_host=" + config.upstream_host +
                        " workers=" + std::to_string(config.workers) +
                        (config.tls.enabled ? " tls=on" : ""));

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  server.Stop();
  llmtap::log::Info("server", "llmtap shutting down");
  return 0;
}
