#include "stream/openai_parser.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace llmtap {

namespace {

constexpr char kDataField[] = "data:";
constexpr std::size_t kDataFieldLength = sizeof(kDataField) - 1;
constexpr char kDoneSentinel[] = "[DONE]";

} // namespace

OpenAIParser::OpenAIParser(std::size_t max_unit_bytes)
    : events_("\n\n", max_unit_bytes), max_unit_bytes_(max_unit_bytes) {}

void OpenAIParser::Feed(const char *data, std::size_t length) {
  if (finalized_) {
    return;
  }
  scratch_.clear();
  scratch_.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    if (data[i] != '\r') {
      scratch_.push_back(data[i]);
    }
  }
  events_.Append(scratch_.data(), scratch_.size());
  std::string event;
  while (!finalized_ && events_.NextUnit(&event)) {
    ConsumeEvent(event);
  }
}

void OpenAIParser::ConsumeEvent(const std::string &event) {
  std::string payload;
  bool has_data = false;
  std::size_t start = 0;
  while (start <= event.size()) {
    auto end = event.find('\n', start);
    if (end == std::string::npos) {
      end = event.size();
    }
    std::string line = event.substr(start, end - start);
    start = end + 1;
    // Comments (":") and other fields (event:, id:, retry:) carry no usage.
    if (line.compare(0, kDataFieldLength, kDataField) != 0) {
      continue;
    }
    std::string value = line.substr(kDataFieldLength);
    if (!value.empty() && value.front() == ' ') {
      value.erase(0, 1);
    }
    if (has_data) {
      payload.push_back('\n');
    }
    payload += value;
    has_data = true;
  }
  if (has_data) {
    saw_data_ = true;
    plain_body_.clear();
    ConsumePayload(payload);
  } else if (!saw_data_ &&
             plain_body_.size() + event.size() + 2 <= max_unit_bytes_) {
    if (!plain_body_.empty()) {
      plain_body_ += "\n\n";
    }
    plain_body_ += event;
  }
}

void OpenAIParser::ConsumePlainBody() {
  json parsed = json::parse(plain_body_, nullptr, false);
  plain_body_.clear();
  if (parsed.is_discarded()) {
    return;
  }
  TakeUsage(parsed);
}

void OpenAIParser::ConsumePayload(const std::string &payload) {
  if (payload == kDoneSentinel) {
    saw_done_ = true;
    finalized_ = true;
    log::Debug("parser.openai", "received [DONE] marker");
    return;
  }
  json parsed = json::parse(payload, nullptr, false);
  if (parsed.is_discarded()) {
    ++outcome_.malformed_units;
    log::Warn("parser.openai", "discarding malformed SSE payload",
              "bytes=" + std::to_string(payload.size()));
    return;
  }
  TakeUsage(parsed);
}

void OpenAIParser::TakeUsage(const json &parsed) {
  if (!parsed.is_object()) {
    return;
  }
  auto usage = parsed.find("usage");
  if (usage == parsed.end() || !usage->is_object()) {
    return; // delta chunk
  }
  auto prompt_tokens = ReadTokenCount(*usage, "prompt_tokens");
  auto completion_tokens = ReadTokenCount(*usage, "completion_tokens");
  if (!prompt_tokens || !completion_tokens) {
    return;
  }
  outcome_.usage.prompt_tokens = prompt_tokens;
  outcome_.usage.completion_tokens = completion_tokens;
  outcome_.status = ParseStatus::kComplete;
  finalized_ = true;
}

ParseOutcome OpenAIParser::Finish(StreamEnd end) {
  if (!finalized_) {
    if (end == StreamEnd::kClean) {
      std::string tail = events_.TakeTail();
      ConsumeEvent(tail);
      if (!finalized_ && !saw_data_ && !plain_body_.empty()) {
        ConsumePlainBody();
      }
    }
    outcome_.truncated = end == StreamEnd::kTruncated;
  }
  outcome_.malformed_units += events_.dropped_units();
  finalized_ = true;
  return outcome_;
}

} // namespace llmtap
