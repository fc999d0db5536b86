#pragma once

#include <string>

namespace llmtap {

struct BackendTarget {
  std::string host;
  int port{0};

  std::string authority() const { return host + ":" + std::to_string(port); }
};

// Declared API family of the upstream path, used as a format hint.
enum class ApiFamily { kUnknown, kOllama, kOpenAI };

const char *ApiFamilyName(ApiFamily family);

struct ProxyRoute {
  BackendTarget backend;
  // Upstream request target: "/{path}[?query]".
  std::string upstream_target;
  ApiFamily family{ApiFamily::kUnknown};
};

enum class RouteStatus { kOk, kNotProxyRoute, kBadPort };

// Parses "/proxy/{port}/{path...}[?query]". `backend_host` fills in the host
// part of the target.
RouteStatus ResolveRoute(const std::string &target,
                         const std::string &backend_host, ProxyRoute *out);

} // namespace llmtap
