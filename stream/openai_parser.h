#pragma once

#include "stream/frame_buffer.h"
#include "stream/parse_outcome.h"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <string>

namespace llmtap {

// Incremental parser for OpenAI-compatible Server-Sent Events. Events are
// separated by a blank line; carriage returns are ignored so CRLF streams
// split the same way. The completion marker is the first event whose JSON
// payload has a top-level `usage` object with integer `prompt_tokens` and
// `completion_tokens`. `data: [DONE]` ends the stream without usage.
// A body with no `data:` field at all (a non-streaming reply) is read as one
// JSON object at clean end of stream.
class OpenAIParser {
public:
  explicit OpenAIParser(std::size_t max_unit_bytes = kDefaultMaxUnitBytes);

  void Feed(const char *data, std::size_t length);
  bool finalized() const { return finalized_; }
  bool saw_done() const { return saw_done_; }
  ParseOutcome Finish(StreamEnd end);

private:
  void ConsumeEvent(const std::string &event);
  void ConsumePayload(const std::string &payload);
  void ConsumePlainBody();
  void TakeUsage(const nlohmann::json &parsed);

  FrameBuffer events_;
  ParseOutcome outcome_;
  std::string scratch_;
  std::string plain_body_;
  std::size_t max_unit_bytes_;
  bool saw_data_{false};
  bool finalized_{false};
  bool saw_done_{false};
};

} // namespace llmtap
