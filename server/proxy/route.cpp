#include "server/proxy/route.h"

#include <cctype>

namespace llmtap {

namespace {

constexpr char kProxyPrefix[] = "/proxy/";

bool StartsWith(const std::string &value, const std::string &prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

ApiFamily FamilyForPath(const std::string &path) {
  // path has its leading '/' and no query.
  if (path == "/api" || StartsWith(path, "/api/")) {
    return ApiFamily::kOllama;
  }
  if (path == "/v1" || StartsWith(path, "/v1/")) {
    return ApiFamily::kOpenAI;
  }
  return ApiFamily::kUnknown;
}

} // namespace

const char *ApiFamilyName(ApiFamily family) {
  switch (family) {
  case ApiFamily::kOllama:
    return "ollama";
  case ApiFamily::kOpenAI:
    return "openai";
  case ApiFamily::kUnknown:
    break;
  }
  return "unknown";
}

RouteStatus ResolveRoute(const std::string &target,
                         const std::string &backend_host, ProxyRoute *out) {
  if (!StartsWith(target, kProxyPrefix)) {
    return RouteStatus::kNotProxyRoute;
  }
  std::string rest = target.substr(sizeof(kProxyPrefix) - 1);
  auto port_end = rest.find_first_of("/?");
  std::string port_text = rest.substr(0, port_end);
  if (port_text.empty()) {
    return RouteStatus::kNotProxyRoute;
  }
  if (port_text.size() > 5) {
    return RouteStatus::kBadPort;
  }
  int port = 0;
  for (char c : port_text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return RouteStatus::kBadPort;
    }
    port = port * 10 + (c - '0');
  }
  if (port < 1 || port > 65535) {
    return RouteStatus::kBadPort;
  }

  std::string upstream =
      port_end == std::string::npos ? std::string() : rest.substr(port_end);
  if (upstream.empty() || upstream[0] == '?') {
    upstream.insert(0, "/");
  }
  std::string path = upstream.substr(0, upstream.find('?'));

  out->backend.host = backend_host;
  out->backend.port = port;
  out->upstream_target = std::move(upstream);
  out->family = FamilyForPath(path);
  return RouteStatus::kOk;
}

} // namespace llmtap
