#include <catch2/catch.hpp>

#include "server/logging/logger.h"
#include "server/logging/metrics_sink.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;

namespace {

llmtap::UsageRecord SampleRecord() {
  llmtap::UsageRecord record;
  record.model = "llama3";
  record.prompt = "Why is the sky blue?";
  record.prompt_tokens = 8;
  record.completion_tokens = 150;
  record.latency_ms = 1234;
  record.timestamp = std::chrono::system_clock::time_point(
      std::chrono::milliseconds(1700000000123LL));
  record.status = llmtap::UsageStatus::kComplete;
  return record;
}

} // namespace

TEST_CASE("UsageRecord serializes the documented schema", "[metrics_sink]") {
  json j = llmtap::ToJson(SampleRecord());
  REQUIRE(j.size() == 7);
  REQUIRE(j["model"] == "llama3");
  REQUIRE(j["prompt"] == "Why is the sky blue?");
  REQUIRE(j["prompt_tokens"] == 8);
  REQUIRE(j["completion_tokens"] == 150);
  REQUIRE(j["latency_ms"] == 1234);
  REQUIRE(j["timestamp"] == "2023-11-14T22:13:20.123Z");
  REQUIRE(j["status"] == "complete");
}

TEST_CASE("UsageRecord missing counts serialize as null", "[metrics_sink]") {
  auto record = SampleRecord();
  record.prompt_tokens.reset();
  record.completion_tokens.reset();
  record.status = llmtap::UsageStatus::kPartial;
  json j = llmtap::ToJson(record);
  REQUIRE(j["prompt_tokens"].is_null());
  REQUIRE(j["completion_tokens"].is_null());
  REQUIRE(j["status"] == "partial");
  REQUIRE(std::string(llmtap::UsageStatusName(llmtap::UsageStatus::kError)) ==
          "error");
}

TEST_CASE("FormatIso8601 pads milliseconds", "[metrics_sink]") {
  auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(5));
  REQUIRE(llmtap::FormatIso8601(tp) == "1970-01-01T00:00:00.005Z");
}

TEST_CASE("JsonLineSink writes one JSON object per line", "[metrics_sink]") {
  std::ostringstream out;
  llmtap::JsonLineSink sink(&out);
  sink.Emit(SampleRecord());
  sink.Emit(SampleRecord());
  std::istringstream lines(out.str());
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    json j = json::parse(line);
    REQUIRE(j["model"] == "llama3");
    ++count;
  }
  REQUIRE(count == 2);
}

TEST_CASE("JsonLineSink can redact prompts", "[metrics_sink]") {
  std::ostringstream out;
  llmtap::JsonLineSink sink(&out, true);
  sink.Emit(SampleRecord());
  json j = json::parse(out.str());
  std::string prompt = j["prompt"].get<std::string>();
  REQUIRE(prompt.rfind("sha256:", 0) == 0);
  REQUIRE(prompt.size() == 7 + 64);
  REQUIRE(prompt.substr(7) ==
          llmtap::JsonLineSink::HashContent("Why is the sky blue?"));
}

TEST_CASE("JsonLineSink appends to a file", "[metrics_sink]") {
  std::string path = "llmtap_test_metrics.jsonl";
  std::remove(path.c_str());
  {
    llmtap::JsonLineSink sink(path);
    REQUIRE(sink.FileEnabled());
    sink.Emit(SampleRecord());
  }
  {
    llmtap::JsonLineSink sink(path);
    sink.Emit(SampleRecord());
  }
  std::ifstream in(path);
  std::string line;
  int count = 0;
  while (std::getline(in, line)) {
    REQUIRE(json::parse(line)["status"] == "complete");
    ++count;
  }
  REQUIRE(count == 2);
  std::remove(path.c_str());
}

TEST_CASE("JsonLineSink survives an unopenable file", "[metrics_sink]") {
  llmtap::JsonLineSink sink("/nonexistent-dir/metrics.jsonl");
  REQUIRE_FALSE(sink.FileEnabled());
  REQUIRE_NOTHROW(sink.Emit(SampleRecord()));
}

TEST_CASE("JsonLineSink keeps lines intact under concurrent emitters",
          "[metrics_sink]") {
  std::ostringstream out;
  llmtap::JsonLineSink sink(&out);
  std::vector<std::thread> emitters;
  for (int i = 0; i < 8; ++i) {
    emitters.emplace_back([&sink] {
      for (int j = 0; j < 50; ++j) {
        sink.Emit(SampleRecord());
      }
    });
  }
  for (auto &t : emitters) {
    t.join();
  }
  std::istringstream lines(out.str());
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    REQUIRE_NOTHROW(json::parse(line));
    ++count;
  }
  REQUIRE(count == 400);
}

TEST_CASE("JsonLineSink logs records above the level threshold",
          "[metrics_sink]") {
  std::ostringstream captured;
  auto *previous = std::cerr.rdbuf(captured.rdbuf());
  llmtap::log::SetLevel(llmtap::log::Level::ERROR);
  {
    llmtap::JsonLineSink sink;
    sink.Emit(SampleRecord());
  }
  llmtap::log::SetLevel(llmtap::log::Level::INFO);
  std::cerr.rdbuf(previous);

  std::string text = captured.str();
  REQUIRE(text.find("metrics") != std::string::npos);
  REQUIRE(text.find("\"model\":\"llama3\"") != std::string::npos);
  REQUIRE(text.find("\"status\":\"complete\"") != std::string::npos);
}
