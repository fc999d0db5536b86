#include "net/http_message.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace llmtap {

namespace {

std::string Trim(const std::string &input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

std::vector<std::string> SplitLines(const std::string &head) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < head.size()) {
    auto end = head.find('\n', start);
    if (end == std::string::npos) {
      end = head.size();
    }
    std::string line = head.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    start = end + 1;
    if (line.empty()) {
      break; // end of head
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

bool ParseHeaderLines(const std::vector<std::string> &lines,
                      HttpHeaders *headers) {
  for (std::size_t i = 1; i < lines.size(); ++i) {
    auto colon = lines[i].find(':');
    if (colon == std::string::npos || colon == 0) {
      return false;
    }
    headers->push_back({lines[i].substr(0, colon),
                        Trim(lines[i].substr(colon + 1))});
  }
  return true;
}

} // namespace

bool EqualsIgnoreCase(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::optional<std::string> FindHeader(const HttpHeaders &headers,
                                      const std::string &name) {
  for (const auto &header : headers) {
    if (EqualsIgnoreCase(header.name, name)) {
      return header.value;
    }
  }
  return std::nullopt;
}

std::string ResponseHead::content_type() const {
  return FindHeader(headers, "Content-Type").value_or("");
}

bool ParseRequestHead(const std::string &head, RequestHead *out) {
  auto lines = SplitLines(head);
  if (lines.empty()) {
    return false;
  }
  const std::string &first_line = lines.front();
  auto method_end = first_line.find(' ');
  if (method_end == std::string::npos || method_end == 0) {
    return false;
  }
  auto target_end = first_line.find(' ', method_end + 1);
  if (target_end == std::string::npos || target_end == method_end + 1) {
    return false;
  }
  RequestHead parsed;
  parsed.method = first_line.substr(0, method_end);
  parsed.target = first_line.substr(method_end + 1, target_end - method_end - 1);
  parsed.version = first_line.substr(target_end + 1);
  if (parsed.version.rfind("HTTP/", 0) != 0) {
    return false;
  }
  if (!ParseHeaderLines(lines, &parsed.headers)) {
    return false;
  }
  *out = std::move(parsed);
  return true;
}

bool ParseResponseHead(const std::string &head, ResponseHead *out) {
  auto lines = SplitLines(head);
  if (lines.empty()) {
    return false;
  }
  const std::string &status_line = lines.front();
  if (status_line.rfind("HTTP/", 0) != 0) {
    return false;
  }
  auto sp1 = status_line.find(' ');
  if (sp1 == std::string::npos) {
    return false;
  }
  auto sp2 = status_line.find(' ', sp1 + 1);
  std::string code = status_line.substr(
      sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);
  if (code.size() != 3 ||
      !std::all_of(code.begin(), code.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    return false;
  }
  ResponseHead parsed;
  parsed.version = status_line.substr(0, sp1);
  parsed.status = std::stoi(code);
  parsed.reason = sp2 == std::string::npos ? "" : status_line.substr(sp2 + 1);
  if (!ParseHeaderLines(lines, &parsed.headers)) {
    return false;
  }
  if (auto te = FindHeader(parsed.headers, "Transfer-Encoding")) {
    parsed.chunked = ToLower(*te).find("chunked") != std::string::npos;
  }
  if (!parsed.chunked) {
    if (auto cl = FindHeader(parsed.headers, "Content-Length")) {
      try {
        long long length = std::stoll(*cl);
        if (length < 0) {
          return false;
        }
        parsed.content_length = static_cast<std::size_t>(length);
      } catch (const std::exception &) {
        return false;
      }
    }
  }
  *out = std::move(parsed);
  return true;
}

std::string BuildErrorResponse(int status, const std::string &status_text,
                               const std::string &error) {
  std::string body = json{{"error", error}}.dump();
  std::string response =
      "HTTP/1.1 " + std::to_string(status) + " " + status_text + "\r\n";
  response += "Content-Type: application/json\r\n";
  response += "Connection: close\r\n";
  response += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
  return response + body;
}

} // namespace llmtap
