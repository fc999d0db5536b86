#include <catch2/catch.hpp>

#include "server/proxy/route.h"

TEST_CASE("ResolveRoute splits port and upstream path", "[route]") {
  llmtap::ProxyRoute route;
  REQUIRE(llmtap::ResolveRoute("/proxy/11434/api/generate", "127.0.0.1",
                               &route) == llmtap::RouteStatus::kOk);
  REQUIRE(route.backend.host == "127.0.0.1");
  REQUIRE(route.backend.port == 11434);
  REQUIRE(route.backend.authority() == "127.0.0.1:11434");
  REQUIRE(route.upstream_target == "/api/generate");
  REQUIRE(route.family == llmtap::ApiFamily::kOllama);
}

TEST_CASE("ResolveRoute keeps the query string", "[route]") {
  llmtap::ProxyRoute route;
  REQUIRE(llmtap::ResolveRoute("/proxy/8000/v1/chat/completions?stream=1",
                               "10.0.0.2", &route) == llmtap::RouteStatus::kOk);
  REQUIRE(route.upstream_target == "/v1/chat/completions?stream=1");
  REQUIRE(route.family == llmtap::ApiFamily::kOpenAI);
}

TEST_CASE("ResolveRoute maps an empty upstream path to root", "[route]") {
  llmtap::ProxyRoute route;
  REQUIRE(llmtap::ResolveRoute("/proxy/9000", "h", &route) ==
          llmtap::RouteStatus::kOk);
  REQUIRE(route.upstream_target == "/");
  REQUIRE(llmtap::ResolveRoute("/proxy/9000?q=1", "h", &route) ==
          llmtap::RouteStatus::kOk);
  REQUIRE(route.upstream_target == "/?q=1");
  REQUIRE(route.family == llmtap::ApiFamily::kUnknown);
}

TEST_CASE("ResolveRoute API family needs a full path segment", "[route]") {
  llmtap::ProxyRoute route;
  REQUIRE(llmtap::ResolveRoute("/proxy/9000/apix/y", "h", &route) ==
          llmtap::RouteStatus::kOk);
  REQUIRE(route.family == llmtap::ApiFamily::kUnknown);
  REQUIRE(llmtap::ResolveRoute("/proxy/9000/v1", "h", &route) ==
          llmtap::RouteStatus::kOk);
  REQUIRE(route.family == llmtap::ApiFamily::kOpenAI);
}

TEST_CASE("ResolveRoute rejects bad ports", "[route]") {
  llmtap::ProxyRoute route;
  REQUIRE(llmtap::ResolveRoute("/proxy/0/api", "h", &route) ==
          llmtap::RouteStatus::kBadPort);
  REQUIRE(llmtap::ResolveRoute("/proxy/65536/api", "h", &route) ==
          llmtap::RouteStatus::kBadPort);
  REQUIRE(llmtap::ResolveRoute("/proxy/12ab/api", "h", &route) ==
          llmtap::RouteStatus::kBadPort);
  REQUIRE(llmtap::ResolveRoute("/proxy/1234567/api", "h", &route) ==
          llmtap::RouteStatus::kBadPort);
}

TEST_CASE("ResolveRoute ignores other paths", "[route]") {
  llmtap::ProxyRoute route;
  REQUIRE(llmtap::ResolveRoute("/metrics", "h", &route) ==
          llmtap::RouteStatus::kNotProxyRoute);
  REQUIRE(llmtap::ResolveRoute("/proxy", "h", &route) ==
          llmtap::RouteStatus::kNotProxyRoute);
  REQUIRE(llmtap::ResolveRoute("/proxy//api", "h", &route) ==
          llmtap::RouteStatus::kNotProxyRoute);
}
