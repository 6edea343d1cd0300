#include "gateway/errors.h"

namespace modelgate {

const char *ErrorKindId(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kUnauthorized:
    return "unauthorized";
  case ErrorKind::kInvalidRequest:
    return "invalid_request";
  case ErrorKind::kUnknownModel:
    return "unknown_model";
  case ErrorKind::kUpstreamTimeout:
    return "upstream_timeout";
  case ErrorKind::kUpstreamError:
    return "upstream_error";
  case ErrorKind::kStreamTruncated:
    return "stream_truncated";
  case ErrorKind::kClientDisconnected:
    return "client_disconnected";
  case ErrorKind::kInternal:
    return "internal_error";
  }
  return "internal_error";
}

const char *ErrorKindType(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kUnauthorized:
    return "authentication_error";
  case ErrorKind::kInvalidRequest:
  case ErrorKind::kUnknownModel:
    return "invalid_request_error";
  default:
    return "server_error";
  }
}

int HttpStatusFor(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kUnauthorized:
    return 401;
  case ErrorKind::kInvalidRequest:
    return 400;
  case ErrorKind::kUnknownModel:
    return 404;
  case ErrorKind::kUpstreamTimeout:
    return 504;
  case ErrorKind::kUpstreamError:
  case ErrorKind::kStreamTruncated:
    return 502;
  case ErrorKind::kClientDisconnected:
    return 499;
  case ErrorKind::kInternal:
    return 500;
  }
  return 500;
}

const char *HttpStatusText(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 204:
    return "No Content";
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  case 499:
    return "Client Closed Request";
  case 500:
    return "Internal Server Error";
  case 502:
    return "Bad Gateway";
  case 503:
    return "Service Unavailable";
  case 504:
    return "Gateway Timeout";
  default:
    return "Error";
  }
}

}  // namespace modelgate
