#pragma once

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace llmtap {

enum class UsageStatus { kComplete, kPartial, kError };

// "complete", "partial" or "error".
const char *UsageStatusName(UsageStatus status);

// The per-request metrics record. Built once, never modified afterwards.
struct UsageRecord {
  std::string model;
  std::string prompt;
  std::optional<uint64_t> prompt_tokens;
  std::optional<uint64_t> completion_tokens;
  uint64_t latency_ms{0};
  std::chrono::system_clock::time_point timestamp;
  UsageStatus status{UsageStatus::kPartial};
};

// Missing token counts serialize as null.
nlohmann::json ToJson(const UsageRecord &record);

// UTC with millisecond precision, e.g. "2026-10-19T08:15:30.123Z".
std::string FormatIso8601(std::chrono::system_clock::time_point tp);

} // namespace llmtap
