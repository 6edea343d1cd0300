#pragma once

#include "gateway/chunk_stream.h"
#include "gateway/errors.h"

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

namespace modelgate {

// Client side of a streamed response.
class EventSink {
 public:
  virtual ~EventSink() = default;

  // Writes the 200 response head with text/event-stream. Called at most
  // once, right before the first frame. False when the client is gone.
  virtual bool BeginStream() = 0;

  // Writes one complete SSE frame, blocking while the client is not
  // accepting data. False when the client is gone.
  virtual bool WriteFrame(const std::string& frame) = 0;
};

enum class RelayOutcome { kCompleted, kUpstreamFailed, kClientGone };

struct RelayResult {
  RelayOutcome outcome{RelayOutcome::kCompleted};
  bool started{false};          // Response head written to the client.
  std::size_t data_frames{0};   // Chunk frames written ([DONE] excluded).
  ErrorKind error{ErrorKind::kInternal};
  std::string error_message;
  int prompt_tokens{0};
  int completion_tokens{0};
};

// Renders one backend chunk as the JSON payload of a data frame.
using ChunkRenderer =
    std::function<std::string(const BackendEvent& event, bool first)>;

// Pulls chunks from a ChunkStream and pushes them to an EventSink one at a
// time, so a slow client slows the backend read instead of growing a
// buffer. Stream shape on success: data frames in backend order, then
// "data: [DONE]". On a failure after the head went out: the frames sent so
// far, then a single error frame and no [DONE]. A failure before anything
// was written leaves the sink untouched so the caller can answer with a
// plain JSON error.
class StreamRelay {
 public:
  explicit StreamRelay(ChunkRenderer renderer)
      : renderer_(std::move(renderer)) {}

  RelayResult Run(ChunkStream& stream, EventSink& sink) const;

 private:
  ChunkRenderer renderer_;
};

}  // namespace modelgate
