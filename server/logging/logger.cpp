#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iostream>
#include <mutex>

using json = nlohmann::json;

namespace llmtap {
namespace log {

namespace {

std::atomic<bool> g_json_mode{false};
std::atomic<int> g_min_level{static_cast<int>(Level::INFO)};
std::mutex g_mutex;

} // namespace

const char *LevelName(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARN:
    return "WARN";
  case Level::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

void SetJsonMode(bool enabled) { g_json_mode.store(enabled); }
bool IsJsonMode() { return g_json_mode.load(); }

void SetLevel(Level level) { g_min_level.store(static_cast<int>(level)); }
Level GetLevel() { return static_cast<Level>(g_min_level.load()); }

bool Enabled(Level level) {
  return static_cast<int>(level) >= g_min_level.load();
}

std::optional<Level> ParseLevel(const std::string &name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lowered == "debug") {
    return Level::DEBUG;
  }
  if (lowered == "info") {
    return Level::INFO;
  }
  if (lowered == "warn" || lowered == "warning") {
    return Level::WARN;
  }
  if (lowered == "error") {
    return Level::ERROR;
  }
  return std::nullopt;
}

namespace {

void Write(Level level, const std::string &component,
           const std::string &message, const std::string &extra) {
  auto now = std::chrono::system_clock::now();
  auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count();

  std::string line;
  if (g_json_mode.load()) {
    json j;
    j["ts"] = ts;
    j["level"] = LevelName(level);
    j["component"] = component;
    j["message"] = message;
    if (!extra.empty()) {
      j["extra"] = extra;
    }
    line = j.dump(-1, ' ', false, json::error_handler_t::replace);
  } else {
    line = std::string("[") + LevelName(level) + "] " + component + ": " +
           message;
    if (!extra.empty()) {
      line += " | " + extra;
    }
  }

  std::lock_guard<std::mutex> lock(g_mutex);
  std::cerr << line << "\n";
}

} // namespace

void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra) {
  if (!Enabled(level)) {
    return;
  }
  Write(level, component, message, extra);
}

void Record(const std::string &component, const std::string &message,
            const std::string &extra) {
  Write(Level::INFO, component, message, extra);
}

} // namespace log
} // namespace llmtap
