#include "server/config/proxy_config.h"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>

namespace llmtap {

namespace {

long long ParseInteger(const std::string &key, const std::string &text) {
  std::size_t consumed = 0;
  long long value = 0;
  try {
    value = std::stoll(text, &consumed);
  } catch (const std::exception &) {
    throw ConfigError(key + ": expected an integer, got '" + text + "'");
  }
  if (consumed != text.size()) {
    throw ConfigError(key + ": expected an integer, got '" + text + "'");
  }
  return value;
}

int ParseInt(const std::string &key, const std::string &text) {
  long long value = ParseInteger(key, text);
  if (value < std::numeric_limits<int>::min() ||
      value > std::numeric_limits<int>::max()) {
    throw ConfigError(key + ": value out of range");
  }
  return static_cast<int>(value);
}

std::size_t ParseSize(const std::string &key, const std::string &text) {
  long long value = ParseInteger(key, text);
  if (value < 0) {
    throw ConfigError(key + ": must not be negative");
  }
  return static_cast<std::size_t>(value);
}

bool ParseBool(const std::string &key, const std::string &text) {
  std::string lower = text;
  for (auto &c : lower) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  throw ConfigError(key + ": expected a boolean, got '" + text + "'");
}

log::Level ParseLogLevel(const std::string &key, const std::string &text) {
  auto level = log::ParseLevel(text);
  if (!level) {
    throw ConfigError(key + ": unknown log level '" + text + "'");
  }
  return *level;
}

bool ParseLogFormat(const std::string &key, const std::string &text) {
  if (text == "json") {
    return true;
  }
  if (text == "text") {
    return false;
  }
  throw ConfigError(key + ": expected 'text' or 'json', got '" + text + "'");
}

// Text of node[key]; false when the key is absent.
bool Scalar(const YAML::Node &node, const std::string &key, std::string *out) {
  if (!node || !node.IsMap()) {
    return false;
  }
  YAML::Node value = node[key];
  if (!value) {
    return false;
  }
  if (!value.IsScalar()) {
    throw ConfigError(key + ": expected a scalar value");
  }
  *out = value.Scalar();
  return true;
}

void ApplyYamlNode(const YAML::Node &root, ProxyConfig *config) {
  if (!root || root.IsNull()) {
    return;
  }
  if (!root.IsMap()) {
    throw ConfigError("config root must be a mapping");
  }
  std::string value;

  YAML::Node server = root["server"];
  if (Scalar(server, "host", &value)) config->host = value;
  if (Scalar(server, "port", &value)) config->port = ParseInt("server.port", value);
  if (Scalar(server, "workers", &value)) config->workers = ParseInt("server.workers", value);
  if (Scalar(server, "client_timeout_ms", &value)) {
    config->client_timeout_ms = ParseInt("server.client_timeout_ms", value);
  }
  if (server && server.IsMap()) {
    YAML::Node tls = server["tls"];
    if (Scalar(tls, "enabled", &value)) config->tls.enabled = ParseBool("server.tls.enabled", value);
    if (Scalar(tls, "cert", &value)) config->tls.cert_path = value;
    if (Scalar(tls, "key", &value)) config->tls.key_path = value;
  }

  YAML::Node upstream = root["upstream"];
  if (Scalar(upstream, "host", &value)) config->upstream_host = value;
  if (Scalar(upstream, "connect_timeout_ms", &value)) {
    config->connect_timeout_ms = ParseInt("upstream.connect_timeout_ms", value);
  }
  if (Scalar(upstream, "read_timeout_ms", &value)) {
    config->read_timeout_ms = ParseInt("upstream.read_timeout_ms", value);
  }

  YAML::Node stream = root["stream"];
  if (Scalar(stream, "parser_buffer_bytes", &value)) {
    config->parser_buffer_bytes = ParseSize("stream.parser_buffer_bytes", value);
  }
  if (Scalar(stream, "client_buffer_bytes", &value)) {
    config->client_buffer_bytes = ParseSize("stream.client_buffer_bytes", value);
  }
  if (Scalar(stream, "max_unit_bytes", &value)) {
    config->max_unit_bytes = ParseSize("stream.max_unit_bytes", value);
  }

  YAML::Node logging = root["logging"];
  if (Scalar(logging, "level", &value)) config->log_level = ParseLogLevel("logging.level", value);
  if (Scalar(logging, "format", &value)) config->json_logs = ParseLogFormat("logging.format", value);
  if (Scalar(logging, "metrics_file", &value)) config->metrics_file = value;
  if (Scalar(logging, "redact_prompts", &value)) {
    config->redact_prompts = ParseBool("logging.redact_prompts", value);
  }
}

} // namespace

const char *ProcessEnv(const char *name) { return std::getenv(name); }

void ApplyYamlFile(const std::string &path, ProxyConfig *config) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw ConfigError("error parsing config file " + path + ": " + e.what());
  }
  ApplyYamlNode(root, config);
}

void ApplyYamlText(const std::string &text, ProxyConfig *config) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("error parsing config: ") + e.what());
  }
  ApplyYamlNode(root, config);
}

void ApplyEnvironment(ProxyConfig *config, const EnvLookup &env) {
  if (const char *v = env("LLMTAP_HOST")) {
    config->host = v;
  }
  if (const char *v = env("LLMTAP_PORT")) {
    config->port = ParseInt("LLMTAP_PORT", v);
  }
  if (const char *v = env("LLMTAP_WORKERS")) {
    config->workers = ParseInt("LLMTAP_WORKERS", v);
  }
  if (const char *v = env("LLMTAP_CLIENT_TIMEOUT_MS")) {
    config->client_timeout_ms = ParseInt("LLMTAP_CLIENT_TIMEOUT_MS", v);
  }
  if (const char *v = env("LLMTAP_TLS_ENABLED")) {
    config->tls.enabled = ParseBool("LLMTAP_TLS_ENABLED", v);
  }
  if (const char *v = env("LLMTAP_TLS_CERT_PATH")) {
    config->tls.cert_path = v;
  }
  if (const char *v = env("LLMTAP_TLS_KEY_PATH")) {
    config->tls.key_path = v;
  }
  if (const char *v = env("LLMTAP_UPSTREAM_HOST")) {
    config->upstream_host = v;
  }
  if (const char *v = env("LLMTAP_CONNECT_TIMEOUT_MS")) {
    config->connect_timeout_ms = ParseInt("LLMTAP_CONNECT_TIMEOUT_MS", v);
  }
  if (const char *v = env("LLMTAP_READ_TIMEOUT_MS")) {
    config->read_timeout_ms = ParseInt("LLMTAP_READ_TIMEOUT_MS", v);
  }
  if (const char *v = env("LLMTAP_PARSER_BUFFER_BYTES")) {
    config->parser_buffer_bytes = ParseSize("LLMTAP_PARSER_BUFFER_BYTES", v);
  }
  if (const char *v = env("LLMTAP_LOG_LEVEL")) {
    config->log_level = ParseLogLevel("LLMTAP_LOG_LEVEL", v);
  }
  if (const char *v = env("LLMTAP_LOG_FORMAT")) {
    config->json_logs = ParseLogFormat("LLMTAP_LOG_FORMAT", v);
  }
  if (const char *v = env("LLMTAP_METRICS_FILE")) {
    config->metrics_file = v;
  }
  if (const char *v = env("LLMTAP_REDACT_PROMPTS")) {
    config->redact_prompts = ParseBool("LLMTAP_REDACT_PROMPTS", v);
  }
}

CommandLine ParseCommandLine(int argc, char **argv) {
  CommandLine cli;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string *target = nullptr;
    if (arg == "--config") {
      target = &cli.config_path;
    } else if (arg == "--host") {
      target = &cli.host;
    } else if (arg == "--port") {
      target = &cli.port;
    } else if (arg == "--log-level") {
      target = &cli.log_level;
    } else {
      throw ConfigError("unknown argument: " + arg);
    }
    if (i + 1 >= argc) {
      throw ConfigError(arg + " requires a value");
    }
    *target = argv[++i];
  }
  return cli;
}

void ApplyCommandLine(const CommandLine &cli, ProxyConfig *config) {
  if (!cli.host.empty()) {
    config->host = cli.host;
  }
  if (!cli.port.empty()) {
    config->port = ParseInt("--port", cli.port);
  }
  if (!cli.log_level.empty()) {
    config->log_level = ParseLogLevel("--log-level", cli.log_level);
  }
}

void ValidateConfig(const ProxyConfig &config) {
  if (config.port < 1 || config.port > 65535) {
    throw ConfigError("server.port must be in 1..65535");
  }
  if (config.workers < 1) {
    throw ConfigError("server.workers must be at least 1");
  }
  if (config.connect_timeout_ms <= 0 || config.read_timeout_ms <= 0) {
    throw ConfigError("upstream timeouts must be positive");
  }
  if (config.client_timeout_ms <= 0) {
    throw ConfigError("server.client_timeout_ms must be positive");
  }
  if (config.parser_buffer_bytes == 0 || config.client_buffer_bytes == 0) {
    throw ConfigError("stream buffer sizes must be positive");
  }
  if (config.max_unit_bytes == 0) {
    throw ConfigError("stream.max_unit_bytes must be positive");
  }
  if (config.tls.enabled &&
      (config.tls.cert_path.empty() || config.tls.key_path.empty())) {
    throw ConfigError("server.tls requires cert and key");
  }
}

ProxyConfig LoadProxyConfig(int argc, char **argv, const EnvLookup &env) {
  CommandLine cli = ParseCommandLine(argc, argv);
  ProxyConfig config;
  if (std::filesystem::exists(cli.config_path)) {
    ApplyYamlFile(cli.config_path, &config);
  }
  ApplyEnvironment(&config, env);
  ApplyCommandLine(cli, &config);
  ValidateConfig(config);
  return config;
}

} // namespace llmtap
