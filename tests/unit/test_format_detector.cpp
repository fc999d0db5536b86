#include <catch2/catch.hpp>

#include "server/proxy/format_detector.h"

using llmtap::ApiFamily;
using llmtap::DetectFormat;
using llmtap::ParserKind;

TEST_CASE("DetectFormat prefers the response content type",
          "[format_detector]") {
  REQUIRE(DetectFormat(ApiFamily::kUnknown, "application/x-ndjson") ==
          ParserKind::kOllama);
  REQUIRE(DetectFormat(ApiFamily::kOpenAI, "application/x-ndjson") ==
          ParserKind::kOllama);
  REQUIRE(DetectFormat(ApiFamily::kUnknown, "application/json") ==
          ParserKind::kOllama);
  REQUIRE(DetectFormat(ApiFamily::kOllama, "text/event-stream") ==
          ParserKind::kOpenAICompatible);
}

TEST_CASE("DetectFormat ignores parameters and case", "[format_detector]") {
  REQUIRE(DetectFormat(ApiFamily::kUnknown,
                       "Text/Event-Stream; charset=utf-8") ==
          ParserKind::kOpenAICompatible);
  REQUIRE(DetectFormat(ApiFamily::kUnknown, " application/json ;charset=x") ==
          ParserKind::kOllama);
}

TEST_CASE("DetectFormat falls back to the route family", "[format_detector]") {
  REQUIRE(DetectFormat(ApiFamily::kOllama, "") == ParserKind::kOllama);
  REQUIRE(DetectFormat(ApiFamily::kOpenAI, "text/plain") ==
          ParserKind::kOpenAICompatible);
}

TEST_CASE("DetectFormat unknown backends pass through", "[format_detector]") {
  REQUIRE(DetectFormat(ApiFamily::kUnknown, "") == ParserKind::kPassthrough);
  REQUIRE(DetectFormat(ApiFamily::kUnknown, "text/html") ==
          ParserKind::kPassthrough);
}

TEST_CASE("DetectFormat plain JSON follows an OpenAI route",
          "[format_detector]") {
  REQUIRE(DetectFormat(ApiFamily::kOpenAI, "application/json") ==
          ParserKind::kOpenAICompatible);
  REQUIRE(DetectFormat(ApiFamily::kOllama, "application/json") ==
          ParserKind::kOllama);
}
