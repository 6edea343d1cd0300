#pragma once

#include "gateway/chunk_stream.h"
#include "gateway/dispatcher.h"
#include "gateway/model_registry.h"
#include "net/http_client.h"

#include <memory>
#include <string>

namespace modelgate {

// Result of opening a backend exchange. Exactly one of the two is set,
// chosen by the relay mode.
struct UpstreamHandle {
  RelayMode mode{RelayMode::kBuffered};
  BackendEvent reply;                    // kBuffered: the whole reply.
  std::unique_ptr<ChunkStream> stream;   // kStreaming: unread chunks.
};

// Seam between the request handler and the network. Tests substitute a
// fake to count calls and script replies.
class Upstream {
 public:
  virtual ~Upstream() = default;

  // Sends `body` to the backend's chat endpoint. `watch_fd` is the client
  // socket (or -1); a hang-up on it cancels any wait.
  //
  // Throws GatewayError:
  //   kUpstreamTimeout     unreachable, or no reply within the deadline
  //   kUpstreamError       non-2xx status or an undecodable reply
  //   kClientDisconnected  the client left while we were waiting
  virtual UpstreamHandle Open(const ModelEntry& backend,
                              const std::string& body, RelayMode mode,
                              int watch_fd) = 0;
};

// Talks HTTP/1.1 to Ollama-style backends. Buffered mode reads the full
// body under ModelEntry::request_timeout; streaming mode returns a lazy
// NDJSON reader whose gaps are bounded by ModelEntry::idle_timeout.
class UpstreamClient : public Upstream {
 public:
  UpstreamClient() = default;

  UpstreamHandle Open(const ModelEntry& backend, const std::string& body,
                      RelayMode mode, int watch_fd) override;

  // Upper bound on buffered bodies and on a single NDJSON line.
  static constexpr std::size_t kMaxReplyBytes = 16 * 1024 * 1024;
  static constexpr std::size_t kMaxLineBytes = 1024 * 1024;

 private:
  net::HttpClient http_;
};

}  // namespace modelgate
