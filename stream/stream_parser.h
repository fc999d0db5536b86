#pragma once

#include "stream/frame_buffer.h"
#include "stream/ollama_parser.h"
#include "stream/openai_parser.h"
#include "stream/parse_outcome.h"

#include <cstddef>
#include <variant>

namespace llmtap {

enum class ParserKind { kOllama, kOpenAICompatible, kPassthrough };

const char *ParserKindName(ParserKind kind);

// Unrecognized formats: bytes are accepted and ignored, and the outcome is
// always partial with no counts.
class PassthroughParser {
public:
  void Feed(const char *, std::size_t) {}
  bool finalized() const { return false; }
  ParseOutcome Finish(StreamEnd end);
};

// The parser variant chosen once per response. Dispatch happens per chunk,
// never per byte.
class StreamParser {
public:
  explicit StreamParser(ParserKind kind,
                        std::size_t max_unit_bytes = kDefaultMaxUnitBytes);

  ParserKind kind() const { return kind_; }
  void Feed(const char *data, std::size_t length);
  bool finalized() const;
  ParseOutcome Finish(StreamEnd end);

private:
  ParserKind kind_;
  std::variant<OllamaParser, OpenAIParser, PassthroughParser> impl_;
};

} // namespace llmtap
