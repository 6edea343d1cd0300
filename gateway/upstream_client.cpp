#include "gateway/upstream_client.h"

#include "server/logging/logger.h"

#include <algorithm>
#include <chrono>
#include <optional>
#include <utility>

namespace modelgate {

namespace {

using net::Clock;
using net::IoStatus;

constexpr std::size_t kMaxErrorBodyBytes = 64 * 1024;
constexpr std::chrono::seconds kErrorBodyGrace{5};

std::string Seconds(std::chrono::seconds s) {
  return std::to_string(s.count()) + "s";
}

std::string TrimLine(const std::string& line) {
  auto begin = line.find_first_not_of(" \t\r");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = line.find_last_not_of(" \t\r");
  return line.substr(begin, end - begin + 1);
}

// Maps a transport failure to the gateway taxonomy. Host and port stay in
// the log line and never reach the client message.
GatewayError TranslateTransport(const ModelEntry& backend,
                                const net::TransportError& err,
                                std::chrono::seconds waited) {
  log::Warn("upstream", "backend transport failure",
            "model=" + backend.name + " backend=" + backend.host + ":" +
                std::to_string(backend.port) + " error=" + err.what());
  switch (err.status()) {
    case IoStatus::kCancelled:
      return GatewayError(ErrorKind::kClientDisconnected,
                          "Client disconnected while waiting for the backend");
    case IoStatus::kTimeout:
      return GatewayError(ErrorKind::kUpstreamTimeout,
                          "Backend for model '" + backend.name +
                              "' did not respond within " + Seconds(waited));
    default:
      return GatewayError(ErrorKind::kUpstreamTimeout,
                          "Backend for model '" + backend.name +
                              "' is unreachable");
  }
}

// Streams NDJSON lines from an open backend response, one BackendEvent per
// line, closing the connection as soon as the reply terminates.
class NdjsonChunkStream : public ChunkStream {
 public:
  NdjsonChunkStream(net::HttpStream http, std::string model,
                    std::chrono::seconds idle_timeout, int watch_fd)
      : http_(std::move(http)),
        model_(std::move(model)),
        idle_timeout_(idle_timeout),
        watch_fd_(watch_fd) {}

  ~NdjsonChunkStream() override { http_.Close(); }

  StreamItem Next() override {
    if (terminal_) {
      return *terminal_;
    }
    while (true) {
      auto newline = buffer_.find('\n');
      if (newline != std::string::npos) {
        std::string line = TrimLine(buffer_.substr(0, newline));
        buffer_.erase(0, newline + 1);
        if (line.empty()) {
          continue;
        }
        if (auto item = Decode(line)) {
          return *item;
        }
        continue;
      }
      if (eof_) {
        if (!TrimLine(buffer_).empty()) {
          // Final line without a trailing newline.
          std::string line = TrimLine(buffer_);
          buffer_.clear();
          if (auto item = Decode(line)) {
            return *item;
          }
          continue;
        }
        return Finish(StreamItem::Failure(
            ErrorKind::kStreamTruncated,
            "Backend stream for model '" + model_ +
                "' ended before completion"));
      }
      if (buffer_.size() > UpstreamClient::kMaxLineBytes) {
        return Finish(StreamItem::Failure(
            ErrorKind::kUpstreamError,
            "Backend stream line exceeded the size limit"));
      }
      IoStatus status =
          http_.ReadBody(&buffer_, Clock::now() + idle_timeout_, watch_fd_);
      switch (status) {
        case IoStatus::kOk:
          break;
        case IoStatus::kEof:
          eof_ = true;
          break;
        case IoStatus::kTimeout:
          return Finish(StreamItem::Failure(
              ErrorKind::kUpstreamTimeout,
              "Backend for model '" + model_ + "' produced no data for " +
                  Seconds(idle_timeout_)));
        case IoStatus::kCancelled:
          return Finish(StreamItem::Failure(ErrorKind::kClientDisconnected,
                                            "Client disconnected"));
        case IoStatus::kError:
          return Finish(StreamItem::Failure(
              ErrorKind::kStreamTruncated,
              "Backend connection for model '" + model_ +
                  "' dropped mid-stream"));
      }
    }
  }

  void Cancel() override {
    if (!terminal_) {
      Finish(StreamItem::Failure(ErrorKind::kClientDisconnected,
                                 "Stream cancelled"));
    }
    http_.Close();
  }

 private:
  // Empty when the line is not a backend event; such lines are skipped.
  std::optional<StreamItem> Decode(const std::string& line) {
    BackendEvent event;
    try {
      event = ParseBackendEvent(line);
    } catch (const GatewayError& e) {
      log::Warn("upstream", "skipping malformed stream line",
                "model=" + model_ + " error=" + e.what() +
                    " line=" + line.substr(0, 200));
      return std::nullopt;
    }
    if (event.error) {
      return Finish(StreamItem::Failure(
          ErrorKind::kUpstreamError,
          "Backend reported an error: " + SummarizeBackendError(line)));
    }
    if (event.done) {
      // Final line: release the connection now, End follows this chunk.
      terminal_ = StreamItem::End();
      http_.Close();
    }
    return StreamItem::Chunk(std::move(event), line);
  }

  StreamItem Finish(StreamItem terminal) {
    terminal_ = terminal;
    http_.Close();
    return terminal;
  }

  net::HttpStream http_;
  std::string model_;
  std::chrono::seconds idle_timeout_;
  int watch_fd_;
  std::string buffer_;
  bool eof_{false};
  std::optional<StreamItem> terminal_;
};

}  // namespace

UpstreamHandle UpstreamClient::Open(const ModelEntry& backend,
                                    const std::string& body, RelayMode mode,
                                    int watch_fd) {
  net::HttpRequest request;
  request.method = "POST";
  request.host = backend.host;
  request.port = backend.port;
  request.path = kBackendChatPath;
  request.body = body;
  request.headers["Accept"] = mode == RelayMode::kStreaming
                                  ? "application/x-ndjson"
                                  : "application/json";

  auto start = Clock::now();
  // Buffered: one deadline for the whole exchange. Streaming: the same
  // deadline for the response head, then idle_timeout between chunks.
  std::chrono::seconds wait = backend.request_timeout;
  auto deadline = start + wait;
  auto connect_deadline = start + backend.connect_timeout;

  log::Debug("upstream", "opening backend exchange",
             "model=" + backend.name + " backend=" + backend.host + ":" +
                 std::to_string(backend.port) +
                 " mode=" + RelayModeName(mode));

  net::HttpStream http;
  try {
    http = http_.Open(request, connect_deadline, deadline, watch_fd);
  } catch (const net::TransportError& e) {
    throw TranslateTransport(backend, e, wait);
  }

  int status = http.head().status;
  if (status < 200 || status >= 300) {
    std::string error_body;
    IoStatus read = http.ReadFullBody(
        &error_body, std::min(deadline, Clock::now() + kErrorBodyGrace),
        kMaxErrorBodyBytes, watch_fd);
    if (read != IoStatus::kOk) {
      log::Debug("upstream", "error body incomplete",
                 "model=" + backend.name +
                     " read=" + net::IoStatusName(read));
    }
    std::string summary = SummarizeBackendError(error_body);
    log::Warn("upstream", "backend returned error status",
              "model=" + backend.name + " status=" + std::to_string(status) +
                  " body=" + summary);
    throw GatewayError(ErrorKind::kUpstreamError,
                       "Backend for model '" + backend.name +
                           "' returned HTTP " + std::to_string(status) +
                           (summary.empty() ? "" : ": " + summary),
                       status, summary);
  }

  UpstreamHandle handle;
  handle.mode = mode;
  if (mode == RelayMode::kStreaming) {
    handle.stream = std::make_unique<NdjsonChunkStream>(
        std::move(http), backend.name, backend.idle_timeout, watch_fd);
    return handle;
  }

  std::string reply_body;
  IoStatus read =
      http.ReadFullBody(&reply_body, deadline, kMaxReplyBytes, watch_fd);
  http.Close();
  switch (read) {
    case IoStatus::kOk:
    case IoStatus::kEof:
      break;
    case IoStatus::kCancelled:
      throw GatewayError(ErrorKind::kClientDisconnected,
                         "Client disconnected while waiting for the backend");
    case IoStatus::kTimeout:
      throw GatewayError(ErrorKind::kUpstreamTimeout,
                         "Backend for model '" + backend.name +
                             "' did not respond within " + Seconds(wait));
    case IoStatus::kError:
      throw GatewayError(ErrorKind::kUpstreamError,
                         "Backend for model '" + backend.name +
                             "' sent an incomplete response");
  }

  handle.reply = ParseBackendEvent(reply_body);
  if (handle.reply.error) {
    throw GatewayError(ErrorKind::kUpstreamError,
                       "Backend reported an error: " + *handle.reply.error);
  }
  log::Debug("upstream", "buffered reply received",
             "model=" + backend.name + " latency_ms=" +
                 std::to_string(std::chrono::duration_cast<
                                    std::chrono::milliseconds>(
                                    Clock::now() - start)
                                    .count()));
  return handle;
}

}  // namespace modelgate
