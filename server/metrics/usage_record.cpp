#include "server/metrics/usage_record.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <ctime>

using json = nlohmann::json;

namespace llmtap {

const char *UsageStatusName(UsageStatus status) {
  switch (status) {
  case UsageStatus::kComplete:
    return "complete";
  case UsageStatus::kPartial:
    return "partial";
  case UsageStatus::kError:
    return "error";
  }
  return "error";
}

json ToJson(const UsageRecord &record) {
  json j;
  j["model"] = record.model;
  j["prompt"] = record.prompt;
  j["prompt_tokens"] =
      record.prompt_tokens ? json(*record.prompt_tokens) : json(nullptr);
  j["completion_tokens"] = record.completion_tokens
                               ? json(*record.completion_tokens)
                               : json(nullptr);
  j["latency_ms"] = record.latency_ms;
  j["timestamp"] = FormatIso8601(record.timestamp);
  j["status"] = UsageStatusName(record.status);
  return j;
}

std::string FormatIso8601(std::chrono::system_clock::time_point tp) {
  auto since_epoch = tp.time_since_epoch();
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - seconds)
          .count();
  if (millis < 0) {
    seconds -= std::chrono::seconds(1);
    millis += 1000;
  }
  std::time_t t = static_cast<std::time_t>(seconds.count());
  std::tm utc{};
  gmtime_r(&t, &utc);
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<int>(millis));
  return buffer;
}

} // namespace llmtap
