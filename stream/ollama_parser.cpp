#include "stream/ollama_parser.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace llmtap {

namespace {

bool IsBlank(const std::string &text) {
  return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

OllamaParser::OllamaParser(std::size_t max_unit_bytes)
    : lines_("\n", max_unit_bytes) {}

void OllamaParser::Feed(const char *data, std::size_t length) {
  if (finalized_) {
    return;
  }
  lines_.Append(data, length);
  std::string line;
  while (!finalized_ && lines_.NextUnit(&line)) {
    ConsumeLine(line);
  }
}

void OllamaParser::ConsumeLine(const std::string &line) {
  if (IsBlank(line)) {
    return;
  }
  json parsed = json::parse(line, nullptr, false);
  if (parsed.is_discarded()) {
    ++outcome_.malformed_units;
    log::Warn("parser.ollama", "discarding malformed NDJSON line",
              "bytes=" + std::to_string(line.size()));
    return;
  }
  if (!parsed.is_object()) {
    return;
  }
  auto done = parsed.find("done");
  if (done == parsed.end() || !done->is_boolean() || !done->get<bool>()) {
    return;
  }
  outcome_.usage.prompt_tokens = ReadTokenCount(parsed, "prompt_eval_count");
  outcome_.usage.completion_tokens = ReadTokenCount(parsed, "eval_count");
  outcome_.status = ParseStatus::kComplete;
  finalized_ = true;
}

ParseOutcome OllamaParser::Finish(StreamEnd end) {
  if (!finalized_) {
    if (end == StreamEnd::kClean) {
      // A non-streaming reply is a single object with no trailing newline.
      std::string tail = lines_.TakeTail();
      ConsumeLine(tail);
    }
    outcome_.truncated = end == StreamEnd::kTruncated;
  }
  outcome_.malformed_units += lines_.dropped_units();
  finalized_ = true;
  return outcome_;
}

} // namespace llmtap
