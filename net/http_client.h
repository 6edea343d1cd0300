#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace modelgate {
namespace net {

using Clock = std::chrono::steady_clock;

enum class IoStatus {
  kOk,        // Progress was made.
  kEof,       // Peer finished cleanly (or the body is complete).
  kTimeout,   // Deadline passed before progress.
  kError,     // Reset, malformed framing, or premature close.
  kCancelled  // The watched client socket hung up while we waited.
};

const char *IoStatusName(IoStatus status);

// Transport failure while establishing or using a connection. `status()` is
// kTimeout when a deadline expired, kCancelled when the watched socket hung
// up, kError otherwise.
class TransportError : public std::runtime_error {
public:
  TransportError(IoStatus status, const std::string &message)
      : std::runtime_error(message), status_(status) {}
  IoStatus status() const { return status_; }

private:
  IoStatus status_;
};

// Owns one non-blocking TCP socket. Closing happens in the destructor, so a
// connection can never outlive the scope that opened it.
class HttpConnection {
public:
  HttpConnection() = default;
  explicit HttpConnection(int fd) : fd_(fd) {}
  ~HttpConnection();
  HttpConnection(const HttpConnection &) = delete;
  HttpConnection &operator=(const HttpConnection &) = delete;
  HttpConnection(HttpConnection &&other) noexcept;
  HttpConnection &operator=(HttpConnection &&other) noexcept;

  // Resolves and connects before `deadline`. Throws TransportError.
  static HttpConnection Connect(const std::string &host, int port,
                                Clock::time_point deadline);

  bool IsOpen() const { return fd_ >= 0; }
  int fd() const { return fd_; }

  IoStatus SendAll(const std::string &payload, Clock::time_point deadline);

  // Waits for readable data, the deadline, or a hang-up on `watch_fd`
  // (ignored when negative), then reads up to `length` bytes. On kOk
  // `*received` > 0; a clean peer close is reported as kEof.
  IoStatus Receive(char *buffer, std::size_t length, ssize_t *received,
                   Clock::time_point deadline, int watch_fd = -1);

  void Close();

private:
  int fd_{-1};
};

// Incremental decoder for "Transfer-Encoding: chunked" bodies.
class ChunkedDecoder {
public:
  // Appends decoded payload bytes to *out. Returns false on malformed
  // framing. Bytes after the terminating chunk are ignored.
  bool Feed(const char *data, std::size_t length, std::string *out);
  bool Finished() const { return state_ == State::kDone; }

private:
  enum class State { kSizeLine, kData, kDataEnd, kTrailer, kDone };

  State state_{State::kSizeLine};
  std::string line_;
  std::size_t remaining_{0};
};

struct HttpResponseHead {
  int status{0};
  std::map<std::string, std::string> headers; // Lower-cased names.

  std::string Header(const std::string &lower_name) const;
};

struct HttpRequest {
  std::string method{"POST"};
  std::string host;
  int port{80};
  std::string path{"/"};
  std::string body;
  std::map<std::string, std::string> headers;
};

// Serialises a request line, headers and body ("Connection: close").
std::string BuildRequest(const HttpRequest &request);

// One in-flight response on an owned connection: head first, then the
// decoded body piece by piece. Moving it moves the connection.
class HttpStream {
public:
  HttpStream() = default;
  explicit HttpStream(HttpConnection conn) : conn_(std::move(conn)) {}

  IoStatus ReadHead(Clock::time_point deadline, int watch_fd = -1);
  const HttpResponseHead &head() const { return head_; }

  // Appends the next decoded body bytes to *out. kOk when bytes were added,
  // kEof once the body is complete, kError when the connection dropped
  // before the declared framing was satisfied.
  IoStatus ReadBody(std::string *out, Clock::time_point deadline,
                    int watch_fd = -1);

  // Reads until the body is complete or `max_bytes` is exceeded (kError).
  IoStatus ReadFullBody(std::string *out, Clock::time_point deadline,
                        std::size_t max_bytes, int watch_fd = -1);

  bool IsOpen() const { return conn_.IsOpen(); }
  void Close() { conn_.Close(); }

private:
  enum class Framing { kContentLength, kChunked, kUntilClose };

  bool ParseHead(const std::string &raw);
  // Moves body bytes from `data` through the framing into *out.
  bool Consume(const char *data, std::size_t length, std::string *out);

  HttpConnection conn_;
  HttpResponseHead head_;
  std::string pending_; // Body bytes read together with the head.
  Framing framing_{Framing::kUntilClose};
  std::size_t remaining_{0};
  ChunkedDecoder chunked_;
  bool body_done_{false};
};

// Plain-HTTP/1.1 client for talking to backends on the local network.
class HttpClient {
public:
  // Connects, sends and reads the head before `deadline`; the caller reads
  // the body. `connect_deadline` bounds only the TCP handshake. Throws
  // TransportError.
  HttpStream Open(const HttpRequest &request, Clock::time_point connect_deadline,
                  Clock::time_point deadline, int watch_fd = -1) const;
};

} // namespace net
} // namespace modelgate
