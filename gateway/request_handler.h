#pragma once

#include "gateway/dispatcher.h"
#include "gateway/errors.h"
#include "gateway/model_registry.h"
#include "gateway/stream_relay.h"
#include "gateway/upstream_client.h"
#include "gateway/usage_record.h"
#include "server/auth/api_key_auth.h"
#include "server/metrics/metrics.h"

#include <chrono>
#include <string>

namespace modelgate {

// Client side of one request: plain responses plus the EventSink used for
// streams. Implemented over a socket by the HTTP server and by fakes in tests.
class ResponseWriter : public EventSink {
 public:
  // Writes a complete response. `extra_headers` is a block of
  // "Name: value\r\n" lines. False when the client is gone.
  virtual bool SendResponse(int status, const std::string& content_type,
                            const std::string& body,
                            const std::string& extra_headers = {}) = 0;

  // Client socket polled for hang-up while waiting on the backend, or -1.
  virtual int WatchFd() const { return -1; }
};

// What the HTTP layer extracted from a POST /v1/chat/completions.
struct ChatCall {
  std::string request_id;
  std::string authorization;  // Raw Authorization header value.
  std::string body;
  // When the connection was picked up, before the request was read. Left
  // default, the handler starts the clock itself.
  std::chrono::steady_clock::time_point received_at{};
};

enum class RequestState {
  kReceived,
  kAuthenticated,
  kDispatched,
  kUpstreamOpen,
  kRelaying,
  kCompleted,
  kFailed,
  kAborted,
};

const char* RequestStateName(RequestState state);

// Drives one chat completion from Received to a terminal state:
// authenticate, parse, dispatch, open the backend, answer or relay, and
// emit exactly one UsageRecord on the way out. Unauthorized, invalid and
// unknown-model requests never reach the Upstream.
class RequestHandler {
 public:
  // `metrics` may be null. The other pointers must outlive the handler.
  RequestHandler(const ModelRegistry* registry, const ApiKeyAuth* auth,
                 Upstream* upstream, UsageSink* usage,
                 MetricsRegistry* metrics = nullptr);

  // Never throws. Returns the terminal state reached.
  RequestState HandleChatCompletion(const ChatCall& call,
                                    ResponseWriter& writer);

  // Refuses a chat completion the HTTP layer could not hand over (oversized
  // or malformed request, wrong method, no capacity) and emits its
  // UsageRecord with `code` as the error kind. Never throws.
  RequestState RejectChatCompletion(const ChatCall& call, int status,
                                    const std::string& code,
                                    const std::string& message,
                                    ResponseWriter& writer,
                                    const std::string& extra_headers = {});

  // Answers with {"error":{...}} and the status mapped from `kind`.
  static bool SendError(ResponseWriter& writer, ErrorKind kind,
                        const std::string& message);

 private:
  const ApiKeyAuth* auth_;
  Upstream* upstream_;
  UsageSink* usage_;
  MetricsRegistry* metrics_;
  Dispatcher dispatcher_;
};

}  // namespace modelgate
