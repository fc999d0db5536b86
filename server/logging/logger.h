#pragma once

#include <optional>
#include <string>

namespace llmtap {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Enable JSON-structured output (one JSON object per line to stderr).
// Default mode is plain text: "[LEVEL] component: message".
// Call from main() based on logging.format before any logging.
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below the threshold are dropped. Default is INFO.
void SetLevel(Level level);
Level GetLevel();
bool Enabled(Level level);

// Case-insensitive: "debug", "info", "warn"/"warning", "error".
std::optional<Level> ParseLevel(const std::string &name);
const char *LevelName(Level level);

// Emit a log entry at the given level.  `component` identifies the subsystem
// (e.g. "server", "proxy", "tee").  `extra` is an optional key=value string
// appended to the JSON object or the text line (ignored when empty).
void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra = {});

// Writes an INFO-labelled entry regardless of the level threshold. Used for
// records that must always reach the log stream.
void Record(const std::string &component, const std::string &message,
            const std::string &extra = {});

// Convenience wrappers.
inline void Debug(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::DEBUG, component, message, extra);
}
inline void Info(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::INFO, component, message, extra);
}
inline void Warn(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::WARN, component, message, extra);
}
inline void Error(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::ERROR, component, message, extra);
}

} // namespace log
} // namespace llmtap
