#include "server/logging/metrics_sink.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace llmtap {

JsonLineSink::JsonLineSink(const std::string &path, bool redact_prompts)
    : redact_prompts_(redact_prompts) {
  if (path.empty()) {
    return;
  }
  file_.open(path, std::ios::app);
  if (!file_.is_open()) {
    log::Error("metrics", "cannot open metrics file, logging records only",
               "path=" + path);
    return;
  }
  out_ = &file_;
}

JsonLineSink::JsonLineSink(std::ostream *out, bool redact_prompts)
    : out_(out), log_records_(false), redact_prompts_(redact_prompts) {}

std::string JsonLineSink::HashContent(const std::string &content) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(content.data()),
         content.size(), hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

std::string JsonLineSink::Render(const UsageRecord &record) const {
  json j = ToJson(record);
  if (redact_prompts_) {
    j["prompt"] = "sha256:" + HashContent(record.prompt);
  }
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

void JsonLineSink::Emit(const UsageRecord &record) {
  std::string line = Render(record);
  if (log_records_) {
    log::Record("metrics", line);
  }
  if (out_ == nullptr) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << line << "\n";
  out_->flush();
}

} // namespace llmtap
