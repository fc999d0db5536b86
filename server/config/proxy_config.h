#pragma once

#include "server/logging/logger.h"

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>

namespace llmtap {

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct TlsSettings {
  bool enabled{false};
  std::string cert_path;
  std::string key_path;
};

struct ProxyConfig {
  // server
  std::string host{"127.0.0.1"};
  int port{3000};
  int workers{16};
  int client_timeout_ms{60000};
  TlsSettings tls;

  // upstream
  std::string upstream_host{"127.0.0.1"};
  int connect_timeout_ms{5000};
  int read_timeout_ms{300000};

  // stream
  std::size_t parser_buffer_bytes{4 * 1024 * 1024};
  std::size_t client_buffer_bytes{16 * 1024 * 1024};
  std::size_t max_unit_bytes{1024 * 1024};

  // logging
  log::Level log_level{log::Level::INFO};
  bool json_logs{false};
  std::string metrics_file;
  bool redact_prompts{false};
};

// Returns nullptr when the variable is unset.
using EnvLookup = std::function<const char *(const char *)>;

const char *ProcessEnv(const char *name);

// Each Apply* step overrides only the keys it names. All throw ConfigError.
void ApplyYamlFile(const std::string &path, ProxyConfig *config);
void ApplyYamlText(const std::string &text, ProxyConfig *config);
void ApplyEnvironment(ProxyConfig *config, const EnvLookup &env = ProcessEnv);

struct CommandLine {
  std::string config_path{"config/llmtap.yaml"};
  std::string host;
  std::string port;
  std::string log_level;
};

CommandLine ParseCommandLine(int argc, char **argv);
void ApplyCommandLine(const CommandLine &cli, ProxyConfig *config);

// Rejects out-of-range values.
void ValidateConfig(const ProxyConfig &config);

// Defaults, then the YAML file (when it exists), then LLMTAP_* variables, then
// flags.
ProxyConfig LoadProxyConfig(int argc, char **argv,
                            const EnvLookup &env = ProcessEnv);

} // namespace llmtap
