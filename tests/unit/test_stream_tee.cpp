#include <catch2/catch.hpp>

#include "stream/stream_tee.h"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace {

std::string DrainAll(llmtap::ChunkChannel &channel) {
  std::string out;
  while (auto chunk = channel.Pop()) {
    out += *chunk->data;
  }
  return out;
}

} // namespace

TEST_CASE("StreamTee delivers identical bytes to both sides", "[stream_tee]") {
  llmtap::StreamTee tee;
  std::vector<std::string> pieces = {"{\"a\":", "1}\n", "", "\xE2\x82",
                                     "\xAC\n"};
  std::string expected;
  std::string client_bytes;
  std::string parser_bytes;
  std::thread client([&] { client_bytes = DrainAll(tee.client()); });
  std::thread parser([&] { parser_bytes = DrainAll(tee.parser()); });
  for (const auto &piece : pieces) {
    expected += piece;
    tee.Push(piece);
  }
  tee.Complete(false);
  client.join();
  parser.join();
  REQUIRE(client_bytes == expected);
  REQUIRE(parser_bytes == expected);
  REQUIRE(tee.chunks_pushed() == 4);
  REQUIRE(tee.bytes_pushed() == expected.size());
  REQUIRE(tee.client().state() == llmtap::ChannelState::kEof);
}

TEST_CASE("StreamTee shares one payload between both sides", "[stream_tee]") {
  llmtap::StreamTee tee;
  tee.Push("payload");
  tee.Complete(false);
  auto a = tee.client().Pop();
  auto b = tee.parser().Pop();
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(a->data.get() == b->data.get());
}

TEST_CASE("StreamTee parser overflow truncates only the parser side",
          "[stream_tee]") {
  llmtap::TeeOptions options;
  options.parser_buffer_bytes = 8;
  llmtap::StreamTee tee(options);
  tee.Push("12345");
  tee.Push("67890"); // parser never drained: 10 bytes > 8
  REQUIRE(tee.parser_truncated());
  REQUIRE_FALSE(tee.ParserActive());
  REQUIRE(tee.ClientActive());
  tee.Push("abc");
  tee.Complete(false);
  REQUIRE(DrainAll(tee.client()) == "1234567890abc");
  REQUIRE(tee.parser().state() == llmtap::ChannelState::kTruncated);
}

TEST_CASE("StreamTee client detach keeps the parser fed", "[stream_tee]") {
  llmtap::StreamTee tee;
  tee.Push("a");
  tee.DetachClient();
  REQUIRE_FALSE(tee.ClientActive());
  REQUIRE(tee.WantsMoreInput());
  tee.Push("b");
  tee.Complete(false);
  REQUIRE(DrainAll(tee.parser()) == "ab");
  REQUIRE_FALSE(tee.client().Pop().has_value());
}

TEST_CASE("StreamTee wants no input once both sides are gone",
          "[stream_tee]") {
  llmtap::StreamTee tee;
  tee.DetachParser();
  REQUIRE(tee.WantsMoreInput());
  tee.DetachClient();
  REQUIRE_FALSE(tee.WantsMoreInput());
}

TEST_CASE("StreamTee completion is signalled once", "[stream_tee]") {
  llmtap::StreamTee tee;
  tee.Complete(true);
  tee.Complete(false);
  REQUIRE(tee.client().state() == llmtap::ChannelState::kError);
  REQUIRE(tee.parser().state() == llmtap::ChannelState::kError);
}

TEST_CASE("StreamTee slow parser does not delay the client", "[stream_tee]") {
  llmtap::TeeOptions options;
  options.parser_buffer_bytes = 1024 * 1024;
  llmtap::StreamTee tee(options);
  constexpr int kChunks = 50;

  std::vector<std::chrono::steady_clock::time_point> received;
  std::thread client([&] {
    while (tee.client().Pop()) {
      received.push_back(std::chrono::steady_clock::now());
    }
  });
  std::thread parser([&] {
    while (tee.parser().Pop()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  });

  std::vector<std::chrono::steady_clock::time_point> sent;
  for (int i = 0; i < kChunks; ++i) {
    sent.push_back(std::chrono::steady_clock::now());
    tee.Push(std::string(100, 'x'));
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  auto pushed_all = std::chrono::steady_clock::now();
  tee.Complete(false);
  client.join();
  tee.DetachParser();
  parser.join();

  // The parser needs about a second; the producer and client must not wait.
  REQUIRE(pushed_all - sent.front() < std::chrono::milliseconds(500));
  REQUIRE(received.size() == static_cast<std::size_t>(kChunks));
  for (int i = 0; i < kChunks; ++i) {
    REQUIRE(received[i] - sent[i] < std::chrono::milliseconds(200));
  }
}
