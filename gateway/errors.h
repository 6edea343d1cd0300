#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace modelgate {

// Closed failure taxonomy shared by every stage of a request.
enum class ErrorKind {
  kUnauthorized,
  kInvalidRequest,
  kUnknownModel,
  kUpstreamTimeout,
  kUpstreamError,
  kStreamTruncated,
  kClientDisconnected,
  kInternal,
};

// Stable identifier reported to clients as error.code ("unknown_model", ...).
const char *ErrorKindId(ErrorKind kind);

// OpenAI-compatible error.type for the kind.
const char *ErrorKindType(ErrorKind kind);

// HTTP status used when the error is reported as a plain response.
// kClientDisconnected maps to 499 and only ever appears in usage records.
int HttpStatusFor(ErrorKind kind);
const char *HttpStatusText(int status);

class GatewayError : public std::runtime_error {
 public:
  GatewayError(ErrorKind kind, const std::string &message,
               int upstream_status = 0, std::string upstream_body = {})
      : std::runtime_error(message), kind_(kind),
        upstream_status_(upstream_status),
        upstream_body_(std::move(upstream_body)) {}

  ErrorKind kind() const { return kind_; }

  // Populated for kUpstreamError: the backend's status and (truncated) body.
  int upstream_status() const { return upstream_status_; }
  const std::string &upstream_body() const { return upstream_body_; }

 private:
  ErrorKind kind_;
  int upstream_status_;
  std::string upstream_body_;
};

}  // namespace modelgate
