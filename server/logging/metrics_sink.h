#pragma once

#include "server/metrics/usage_record.h"

#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

namespace llmtap {

// Process-wide destination for usage records. Emit() is called concurrently
// from request threads.
class MetricsSink {
public:
  virtual ~MetricsSink() = default;
  virtual void Emit(const UsageRecord &record) = 0;
};

// One compact JSON object per record.
class JsonLineSink : public MetricsSink {
public:
  // Records are always logged (INFO label, component "metrics", regardless of
  // the level threshold) and, when `path` is set, appended to that file.
  // redact_prompts replaces the prompt with its SHA-256 digest
  // ("sha256:<hex>").
  explicit JsonLineSink(const std::string &path = {},
                        bool redact_prompts = false);
  // Records are written to `out` only.
  explicit JsonLineSink(std::ostream *out, bool redact_prompts = false);

  void Emit(const UsageRecord &record) override;

  bool FileEnabled() const { return file_.is_open(); }

  std::string Render(const UsageRecord &record) const;

  // Hash a string to its SHA-256 hex representation (64 chars).
  static std::string HashContent(const std::string &content);

private:
  std::ofstream file_;
  std::ostream *out_{nullptr};
  std::mutex mutex_;
  bool log_records_{true};
  bool redact_prompts_{false};
};

} // namespace llmtap
