#include "server/proxy/format_detector.h"

#include "net/http_message.h"

namespace llmtap {

namespace {

std::string MediaType(const std::string &content_type) {
  std::string media = ToLower(content_type.substr(0, content_type.find(';')));
  auto begin = media.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = media.find_last_not_of(" \t");
  return media.substr(begin, end - begin + 1);
}

} // namespace

ParserKind DetectFormat(ApiFamily family, const std::string &content_type) {
  std::string media = MediaType(content_type);
  if (media == "application/x-ndjson") {
    return ParserKind::kOllama;
  }
  if (media == "application/json") {
    // Both APIs answer non-streaming calls with plain JSON; the route decides.
    return family == ApiFamily::kOpenAI ? ParserKind::kOpenAICompatible
                                        : ParserKind::kOllama;
  }
  if (media == "text/event-stream") {
    return ParserKind::kOpenAICompatible;
  }
  switch (family) {
  case ApiFamily::kOllama:
    return ParserKind::kOllama;
  case ApiFamily::kOpenAI:
    return ParserKind::kOpenAICompatible;
  case ApiFamily::kUnknown:
    break;
  }
  return ParserKind::kPassthrough;
}

} // namespace llmtap
