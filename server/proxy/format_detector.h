#pragma once

#include "server/proxy/route.h"
#include "stream/stream_parser.h"

#include <string>

namespace llmtap {

// Chooses the parser variant for a response. The response content type wins,
// except that application/json follows an OpenAI route family. Otherwise the
// family is the fallback, and anything else is passthrough.
ParserKind DetectFormat(ApiFamily family, const std::string &content_type);

} // namespace llmtap
