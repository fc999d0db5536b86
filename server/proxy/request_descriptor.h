#pragma once

#include <string>

namespace llmtap {

struct RequestDescriptor {
  std::string model;
  // `prompt`, or the `messages` array rendered as "role: content" lines.
  std::string prompt;
  bool stream_requested{false};
};

// Reads model and prompt from a JSON request body. Never fails: a body that is
// not a JSON object yields an empty descriptor. The body is not modified.
RequestDescriptor ExtractRequestDescriptor(const std::string &body);

} // namespace llmtap
