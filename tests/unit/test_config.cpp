#include <catch2/catch.hpp>

#include "server/config/proxy_config.h"

#include <cstdio>
#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace {

llmtap::EnvLookup FakeEnv(const std::map<std::string, std::string> &vars) {
  return [vars](const char *name) -> const char * {
    auto it = vars.find(name);
    return it == vars.end() ? nullptr : it->second.c_str();
  };
}

struct Argv {
  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    for (auto &arg : storage) {
      pointers.push_back(&arg[0]);
    }
  }
  int argc() const { return static_cast<int>(pointers.size()); }
  char **argv() { return pointers.data(); }

  std::vector<std::string> storage;
  std::vector<char *> pointers;
};

} // namespace

TEST_CASE("ProxyConfig defaults", "[config]") {
  llmtap::ProxyConfig config;
  REQUIRE(config.host == "127.0.0.1");
  REQUIRE(config.port == 3000);
  REQUIRE(config.workers == 16);
  REQUIRE(config.upstream_host == "127.0.0.1");
  REQUIRE(config.connect_timeout_ms == 5000);
  REQUIRE(config.parser_buffer_bytes == 4u * 1024 * 1024);
  REQUIRE(config.log_level == llmtap::log::Level::INFO);
  REQUIRE_FALSE(config.json_logs);
  REQUIRE_NOTHROW(llmtap::ValidateConfig(config));
}

TEST_CASE("ProxyConfig reads YAML sections", "[config]") {
  llmtap::ProxyConfig config;
  llmtap::ApplyYamlText(R"(
server:
  host: 0.0.0.0
  port: 8088
  workers: 4
upstream:
  host: 10.0.0.5
  connect_timeout_ms: 250
stream:
  parser_buffer_bytes: 1024
logging:
  level: debug
  format: json
  metrics_file: /tmp/usage.jsonl
)",
                        &config);
  REQUIRE(config.host == "0.0.0.0");
  REQUIRE(config.port == 8088);
  REQUIRE(config.workers == 4);
  REQUIRE(config.upstream_host == "10.0.0.5");
  REQUIRE(config.connect_timeout_ms == 250);
  REQUIRE(config.read_timeout_ms == 300000);
  REQUIRE(config.parser_buffer_bytes == 1024);
  REQUIRE(config.log_level == llmtap::log::Level::DEBUG);
  REQUIRE(config.json_logs);
  REQUIRE(config.metrics_file == "/tmp/usage.jsonl");
}

TEST_CASE("ProxyConfig rejects malformed YAML and values", "[config]") {
  llmtap::ProxyConfig config;
  REQUIRE_THROWS_AS(llmtap::ApplyYamlText("server: [unclosed", &config),
                    llmtap::ConfigError);
  REQUIRE_THROWS_AS(llmtap::ApplyYamlText("server:\n  port: abc\n", &config),
                    llmtap::ConfigError);
  REQUIRE_THROWS_AS(llmtap::ApplyYamlText("logging:\n  level: loud\n", &config),
                    llmtap::ConfigError);
  REQUIRE_THROWS_AS(
      llmtap::ApplyYamlText("stream:\n  parser_buffer_bytes: -1\n", &config),
      llmtap::ConfigError);
  REQUIRE_THROWS_AS(llmtap::ApplyYamlText("- a\n- b\n", &config),
                    llmtap::ConfigError);
}

TEST_CASE("ProxyConfig environment overrides YAML", "[config]") {
  llmtap::ProxyConfig config;
  llmtap::ApplyYamlText("server:\n  port: 8088\n", &config);
  llmtap::ApplyEnvironment(&config, FakeEnv({{"LLMTAP_PORT", "9090"},
                                             {"LLMTAP_LOG_LEVEL", "warn"},
                                             {"LLMTAP_CONNECT_TIMEOUT_MS", "42"},
                                             {"LLMTAP_REDACT_PROMPTS", "true"}}));
  REQUIRE(config.port == 9090);
  REQUIRE(config.log_level == llmtap::log::Level::WARN);
  REQUIRE(config.connect_timeout_ms == 42);
  REQUIRE(config.redact_prompts);
  REQUIRE_THROWS_AS(
      llmtap::ApplyEnvironment(&config, FakeEnv({{"LLMTAP_WORKERS", "many"}})),
      llmtap::ConfigError);
}

TEST_CASE("ProxyConfig command line wins", "[config]") {
  std::string path = "llmtap_test_config.yaml";
  {
    std::ofstream out(path);
    out << "server:\n  port: 8088\n  host: 0.0.0.0\n";
  }
  Argv args({"llmtap", "--config", path, "--port", "7070", "--log-level",
             "error"});
  auto config = llmtap::LoadProxyConfig(
      args.argc(), args.argv(), FakeEnv({{"LLMTAP_PORT", "9090"}}));
  REQUIRE(config.port == 7070);
  REQUIRE(config.host == "0.0.0.0");
  REQUIRE(config.log_level == llmtap::log::Level::ERROR);
  std::remove(path.c_str());
}

TEST_CASE("ProxyConfig missing file keeps defaults", "[config]") {
  Argv args({"llmtap", "--config", "/nonexistent/llmtap.yaml"});
  auto config = llmtap::LoadProxyConfig(args.argc(), args.argv(), FakeEnv({}));
  REQUIRE(config.port == 3000);
}

TEST_CASE("ProxyConfig rejects bad arguments and ranges", "[config]") {
  Argv dangling({"llmtap", "--port"});
  REQUIRE_THROWS_AS(llmtap::ParseCommandLine(dangling.argc(), dangling.argv()),
                    llmtap::ConfigError);
  Argv unknown({"llmtap", "--verbose", "1"});
  REQUIRE_THROWS_AS(llmtap::ParseCommandLine(unknown.argc(), unknown.argv()),
                    llmtap::ConfigError);

  llmtap::ProxyConfig config;
  config.port = 70000;
  REQUIRE_THROWS_AS(llmtap::ValidateConfig(config), llmtap::ConfigError);
  config = llmtap::ProxyConfig{};
  config.tls.enabled = true;
  REQUIRE_THROWS_AS(llmtap::ValidateConfig(config), llmtap::ConfigError);
}

TEST_CASE("ProxyConfig client timeout", "[config]") {
  llmtap::ProxyConfig config;
  REQUIRE(config.client_timeout_ms == 60000);
  llmtap::ApplyYamlText("server:\n  client_timeout_ms: 1500\n", &config);
  REQUIRE(config.client_timeout_ms == 1500);
  llmtap::ApplyEnvironment(&config,
                           FakeEnv({{"LLMTAP_CLIENT_TIMEOUT_MS", "250"}}));
  REQUIRE(config.client_timeout_ms == 250);
  config.client_timeout_ms = 0;
  REQUIRE_THROWS_AS(llmtap::ValidateConfig(config), llmtap::ConfigError);
}
