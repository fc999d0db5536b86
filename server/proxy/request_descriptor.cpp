#include "server/proxy/request_descriptor.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace llmtap {

namespace {

std::string StringField(const json &object, const char *key) {
  auto it = object.find(key);
  if (it != object.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return {};
}

// Plain string content, or the text parts of multi-part content.
std::string MessageContent(const json &content) {
  if (content.is_string()) {
    return content.get<std::string>();
  }
  std::string text;
  if (!content.is_array()) {
    return text;
  }
  for (const auto &part : content) {
    if (!part.is_object()) {
      continue;
    }
    std::string piece = StringField(part, "text");
    if (piece.empty()) {
      continue;
    }
    if (!text.empty()) {
      text += "\n";
    }
    text += piece;
  }
  return text;
}

std::string RenderMessages(const json &messages) {
  std::string rendered;
  for (const auto &message : messages) {
    if (!message.is_object()) {
      continue;
    }
    if (!rendered.empty()) {
      rendered += "\n";
    }
    rendered += StringField(message, "role");
    rendered += ": ";
    auto content = message.find("content");
    if (content != message.end()) {
      rendered += MessageContent(*content);
    }
  }
  return rendered;
}

} // namespace

RequestDescriptor ExtractRequestDescriptor(const std::string &body) {
  RequestDescriptor descriptor;
  if (body.empty()) {
    return descriptor;
  }
  json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    log::Debug("proxy", "request body is not a JSON object");
    return descriptor;
  }
  descriptor.model = StringField(parsed, "model");
  auto prompt = parsed.find("prompt");
  auto messages = parsed.find("messages");
  if (prompt != parsed.end() && prompt->is_string()) {
    descriptor.prompt = prompt->get<std::string>();
  } else if (messages != parsed.end() && messages->is_array()) {
    descriptor.prompt = RenderMessages(*messages);
  }
  auto stream = parsed.find("stream");
  descriptor.stream_requested =
      stream != parsed.end() && stream->is_boolean() && stream->get<bool>();
  return descriptor;
}

} // namespace llmtap
