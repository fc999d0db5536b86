#include "stream/parse_outcome.h"

#include <nlohmann/json.hpp>

namespace llmtap {

std::optional<uint64_t> ReadTokenCount(const nlohmann::json &object,
                                       const char *key) {
  if (!object.is_object()) {
    return std::nullopt;
  }
  auto it = object.find(key);
  if (it == object.end()) {
    return std::nullopt;
  }
  if (it->is_number_unsigned()) {
    return it->get<uint64_t>();
  }
  if (it->is_number_integer() && it->get<int64_t>() >= 0) {
    return static_cast<uint64_t>(it->get<int64_t>());
  }
  return std::nullopt;
}

} // namespace llmtap
