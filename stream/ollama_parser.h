#pragma once

#include "stream/frame_buffer.h"
#include "stream/parse_outcome.h"

#include <cstddef>
#include <string>

namespace llmtap {

// Incremental parser for Ollama's NDJSON stream. The completion marker is the
// first line whose object carries `"done": true`; its `prompt_eval_count` and
// `eval_count` become the prompt/completion token counts.
class OllamaParser {
public:
  explicit OllamaParser(std::size_t max_unit_bytes = kDefaultMaxUnitBytes);

  void Feed(const char *data, std::size_t length);
  bool finalized() const { return finalized_; }
  ParseOutcome Finish(StreamEnd end);

private:
  void ConsumeLine(const std::string &line);

  FrameBuffer lines_;
  ParseOutcome outcome_;
  bool finalized_{false};
};

} // namespace llmtap
