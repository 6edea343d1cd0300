#pragma once

#include "gateway/backend_protocol.h"
#include "gateway/errors.h"

#include <string>
#include <utility>

namespace modelgate {

// One element pulled from a streamed backend reply.
struct StreamItem {
  enum class Kind { kChunk, kEnd, kError };

  Kind kind{Kind::kEnd};
  BackendEvent event;   // kChunk: the decoded line.
  std::string raw;      // kChunk: the line as received.
  ErrorKind error{ErrorKind::kInternal};  // kError
  std::string message;                    // kError

  static StreamItem Chunk(BackendEvent event, std::string raw) {
    StreamItem item;
    item.kind = Kind::kChunk;
    item.event = std::move(event);
    item.raw = std::move(raw);
    return item;
  }
  static StreamItem End() { return StreamItem{}; }
  static StreamItem Failure(ErrorKind error, std::string message) {
    StreamItem item;
    item.kind = Kind::kError;
    item.error = error;
    item.message = std::move(message);
    return item;
  }

  bool Terminal() const { return kind != Kind::kChunk; }
};

// Lazy, single-consumer sequence of backend chunks in arrival order. At most
// one chunk is held at a time. Once a terminal item (kEnd or kError) has been
// returned, every later Next() returns that same item.
class ChunkStream {
 public:
  virtual ~ChunkStream() = default;

  // Blocks until the next chunk, the end of the reply or a failure.
  virtual StreamItem Next() = 0;

  // Releases the upstream connection. Idempotent; after Cancel() Next()
  // reports kClientDisconnected unless the stream had already terminated.
  virtual void Cancel() = 0;
};

}  // namespace modelgate
