#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace llmtap {

struct HttpHeader {
  std::string name;
  std::string value;
};

// Order-preserving; names keep their original spelling.
using HttpHeaders = std::vector<HttpHeader>;

struct RequestHead {
  std::string method;
  std::string target;
  std::string version{"HTTP/1.1"};
  HttpHeaders headers;
};

struct ResponseHead {
  int status{0};
  std::string reason;
  std::string version;
  HttpHeaders headers;
  bool chunked{false};
  std::optional<std::size_t> content_length;

  std::string content_type() const;
};

bool EqualsIgnoreCase(const std::string &a, const std::string &b);
std::string ToLower(std::string value);

// Case-insensitive lookup of the first header named `name`.
std::optional<std::string> FindHeader(const HttpHeaders &headers,
                                      const std::string &name);

// Both accept the head with or without its terminating blank line and
// tolerate bare LF line endings.
bool ParseRequestHead(const std::string &head, RequestHead *out);
bool ParseResponseHead(const std::string &head, ResponseHead *out);

// Status line plus JSON error body, Content-Length framed, connection close.
std::string BuildErrorResponse(int status, const std::string &status_text,
                               const std::string &error);

} // namespace llmtap
