#include "stream/stream_parser.h"

namespace llmtap {

namespace {

std::variant<OllamaParser, OpenAIParser, PassthroughParser>
MakeVariant(ParserKind kind, std::size_t max_unit_bytes) {
  switch (kind) {
  case ParserKind::kOllama:
    return OllamaParser(max_unit_bytes);
  case ParserKind::kOpenAICompatible:
    return OpenAIParser(max_unit_bytes);
  case ParserKind::kPassthrough:
    break;
  }
  return PassthroughParser();
}

} // namespace

const char *ParserKindName(ParserKind kind) {
  switch (kind) {
  case ParserKind::kOllama:
    return "ollama";
  case ParserKind::kOpenAICompatible:
    return "openai";
  case ParserKind::kPassthrough:
    return "passthrough";
  }
  return "unknown";
}

ParseOutcome PassthroughParser::Finish(StreamEnd end) {
  ParseOutcome outcome;
  outcome.truncated = end == StreamEnd::kTruncated;
  return outcome;
}

StreamParser::StreamParser(ParserKind kind, std::size_t max_unit_bytes)
    : kind_(kind), impl_(MakeVariant(kind, max_unit_bytes)) {}

void StreamParser::Feed(const char *data, std::size_t length) {
  std::visit([&](auto &parser) { parser.Feed(data, length); }, impl_);
}

bool StreamParser::finalized() const {
  return std::visit([](const auto &parser) { return parser.finalized(); },
                    impl_);
}

ParseOutcome StreamParser::Finish(StreamEnd end) {
  return std::visit([&](auto &parser) { return parser.Finish(end); }, impl_);
}

} // namespace llmtap
