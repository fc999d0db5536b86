#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace llmtap {

enum class ParseStatus { kComplete, kPartialNoUsage };

struct TokenUsage {
  std::optional<uint64_t> prompt_tokens;
  std::optional<uint64_t> completion_tokens;
};

// How the parser's input ended.
//   kClean:     upstream EOF; a trailing undelimited unit is still examined.
//   kTruncated: the tee dropped the parser side; nothing more is examined.
//   kAborted:   upstream or framing failure; nothing more is examined.
enum class StreamEnd { kClean, kTruncated, kAborted };

struct ParseOutcome {
  ParseStatus status{ParseStatus::kPartialNoUsage};
  TokenUsage usage;
  std::size_t malformed_units{0};
  bool truncated{false};
};

// Non-negative integer field of a JSON object, or nullopt when missing or of
// another type.
std::optional<uint64_t> ReadTokenCount(const nlohmann::json &object,
                                       const char *key);

} // namespace llmtap
