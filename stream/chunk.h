#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace llmtap {

// One upstream read. The payload is allocated once and shared read-only by
// every queue it is handed to.
struct Chunk {
  std::shared_ptr<const std::string> data;
  uint64_t sequence{0};

  std::size_t size() const { return data ? data->size() : 0; }
};

inline Chunk MakeChunk(std::string bytes, uint64_t sequence) {
  Chunk chunk;
  chunk.data = std::make_shared<const std::string>(std::move(bytes));
  chunk.sequence = sequence;
  return chunk;
}

enum class ReadStatus { kData, kEof, kError };

// Ordered producer of response body bytes. Next() blocks until data, end of
// stream or failure.
class ChunkSource {
public:
  virtual ~ChunkSource() = default;
  virtual ReadStatus Next(std::string *out) = 0;
};

// Destination for client-bound bytes. Write() returns false once the peer is
// gone. Finish() is called exactly once after the last write.
class ByteSink {
public:
  virtual ~ByteSink() = default;
  virtual bool Write(const char *data, std::size_t length) = 0;
  virtual void Finish() {}
};

} // namespace llmtap
