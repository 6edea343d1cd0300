#include "gateway/request_handler.h"

#include "gateway/backend_protocol.h"
#include "gateway/chat_request.h"
#include "gateway/openai_format.h"
#include "server/logging/logger.h"

#include <chrono>
#include <ctime>
#include <exception>

namespace modelgate {

namespace {

using SteadyClock = std::chrono::steady_clock;

// Emits the request's UsageRecord exactly once: explicitly, or from the
// destructor on any exit path that skipped it.
class UsageFinalizer {
 public:
  UsageFinalizer(UsageSink* sink, MetricsRegistry* metrics,
                 SteadyClock::time_point received_at)
      : sink_(sink), metrics_(metrics), received_at_(received_at) {
    // Until a path says otherwise, the request failed internally.
    record_.outcome = UsageOutcome::kFailed;
    record_.error_kind = ErrorKindId(ErrorKind::kInternal);
    record_.http_status = HttpStatusFor(ErrorKind::kInternal);
  }
  ~UsageFinalizer() { Emit(); }

  UsageFinalizer(const UsageFinalizer&) = delete;
  UsageFinalizer& operator=(const UsageFinalizer&) = delete;

  UsageRecord& record() { return record_; }

  // Per-model metrics are only kept for names the registry resolved.
  void set_routed_model(const std::string& model) { routed_model_ = model; }

  void Emit() {
    if (emitted_) {
      return;
    }
    emitted_ = true;
    record_.timestamp = std::time(nullptr);
    record_.latency_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            SteadyClock::now() - received_at_)
            .count();
    try {
      if (metrics_) {
        metrics_->RecordRequest(routed_model_, UsageOutcomeName(record_.outcome),
                                record_.tokens_prompt, record_.tokens_response);
        metrics_->RecordLatency(static_cast<double>(record_.latency_ms));
        if (!record_.error_kind.empty()) {
          metrics_->RecordError(record_.error_kind);
        }
      }
      if (sink_) {
        sink_->Emit(record_);
      }
    } catch (const std::exception& e) {
      log::Error("usage", "failed to emit usage record",
                 "request_id=" + record_.request_id + " error=" + e.what());
    }
  }

 private:
  UsageSink* sink_;
  MetricsRegistry* metrics_;
  SteadyClock::time_point received_at_;
  UsageRecord record_;
  std::string routed_model_;
  bool emitted_{false};
};

SteadyClock::time_point ReceivedAt(const ChatCall& call) {
  return call.received_at == SteadyClock::time_point{} ? SteadyClock::now()
                                                       : call.received_at;
}

}  // namespace

const char* RequestStateName(RequestState state) {
  switch (state) {
    case RequestState::kReceived:
      return "received";
    case RequestState::kAuthenticated:
      return "authenticated";
    case RequestState::kDispatched:
      return "dispatched";
    case RequestState::kUpstreamOpen:
      return "upstream_open";
    case RequestState::kRelaying:
      return "relaying";
    case RequestState::kCompleted:
      return "completed";
    case RequestState::kFailed:
      return "failed";
    case RequestState::kAborted:
      return "aborted";
  }
  return "unknown";
}

RequestHandler::RequestHandler(const ModelRegistry* registry,
                               const ApiKeyAuth* auth, Upstream* upstream,
                               UsageSink* usage, MetricsRegistry* metrics)
    : auth_(auth),
      upstream_(upstream),
      usage_(usage),
      metrics_(metrics),
      dispatcher_(registry) {}

bool RequestHandler::SendError(ResponseWriter& writer, ErrorKind kind,
                               const std::string& message) {
  std::string headers;
  if (kind == ErrorKind::kUnauthorized) {
    headers = "WWW-Authenticate: Bearer\r\n";
  }
  return writer.SendResponse(HttpStatusFor(kind), "application/json",
                             BuildErrorBody(kind, message), headers);
}

RequestState RequestHandler::RejectChatCompletion(
    const ChatCall& call, int status, const std::string& code,
    const std::string& message, ResponseWriter& writer,
    const std::string& extra_headers) {
  UsageFinalizer finalizer(usage_, metrics_, ReceivedAt(call));
  UsageRecord& record = finalizer.record();
  record.request_id = call.request_id;
  record.outcome = UsageOutcome::kFailed;
  record.error_kind = code;
  record.http_status = status;
  log::Debug("handler", "request refused before parsing",
             "request_id=" + call.request_id + " status=" +
                 std::to_string(status) + " error=" + code);
  const char* type = status >= 500 ? "server_error" : "invalid_request_error";
  try {
    if (!writer.SendResponse(status, "application/json",
                             BuildErrorBody(code, type, message),
                             extra_headers)) {
      log::Debug("handler", "client gone before error response",
                 "request_id=" + call.request_id);
    }
  } catch (const std::exception& e) {
    log::Error("handler", "failed to send refusal",
               "request_id=" + call.request_id + " error=" + e.what());
  }
  return RequestState::kFailed;
}

RequestState RequestHandler::HandleChatCompletion(const ChatCall& call,
                                                  ResponseWriter& writer) {
  UsageFinalizer finalizer(usage_, metrics_, ReceivedAt(call));
  UsageRecord& record = finalizer.record();
  record.request_id = call.request_id;
  RequestState state = RequestState::kReceived;

  auto fail = [&](ErrorKind kind, const std::string& message) {
    state = RequestState::kFailed;
    record.outcome = UsageOutcome::kFailed;
    record.error_kind = ErrorKindId(kind);
    record.http_status = HttpStatusFor(kind);
    if (!SendError(writer, kind, message)) {
      log::Debug("handler", "client gone before error response",
                 "request_id=" + call.request_id);
    }
  };
  auto mark_aborted = [&]() {
    state = RequestState::kAborted;
    record.outcome = UsageOutcome::kAborted;
    record.error_kind = ErrorKindId(ErrorKind::kClientDisconnected);
    record.http_status = HttpStatusFor(ErrorKind::kClientDisconnected);
    log::Info("handler", "client disconnected",
              "request_id=" + call.request_id + " model=" + record.model);
  };

  try {
    Principal principal =
        auth_->Authenticate(ApiKeyAuth::ExtractBearerToken(call.authorization));
    record.principal = principal.display_name;
    state = RequestState::kAuthenticated;

    InboundRequest request = ParseChatRequest(call.body);
    record.model = request.model;
    record.stream = request.stream;

    Route route = dispatcher_.Dispatch(request, principal);
    state = RequestState::kDispatched;
    finalizer.set_routed_model(route.backend->name);

    std::string backend_body = BuildBackendRequest(*route.backend, request);
    UpstreamHandle handle = upstream_->Open(*route.backend, backend_body,
                                            route.mode, writer.WatchFd());
    state = RequestState::kUpstreamOpen;

    std::string completion_id = "chatcmpl-" + call.request_id;
    std::time_t created = std::time(nullptr);

    if (route.mode == RelayMode::kBuffered) {
      record.tokens_prompt = handle.reply.prompt_eval_count.value_or(0);
      record.tokens_response = handle.reply.eval_count.value_or(0);
      std::string body = BuildCompletionBody(completion_id, request.model,
                                             created, handle.reply);
      if (!writer.SendResponse(200, "application/json", body)) {
        mark_aborted();
        return state;
      }
      state = RequestState::kCompleted;
      record.outcome = UsageOutcome::kCompleted;
      record.error_kind.clear();
      record.http_status = 200;
      return state;
    }

    state = RequestState::kRelaying;
    const std::string& model = request.model;
    StreamRelay relay([&](const BackendEvent& event, bool first) {
      return BuildStreamChunk(completion_id, model, created, event, first);
    });
    RelayResult result = relay.Run(*handle.stream, writer);
    handle.stream.reset();

    record.tokens_prompt = result.prompt_tokens;
    record.tokens_response = result.completion_tokens;
    if (metrics_) {
      metrics_->RecordStreamFrames(result.data_frames);
    }
    switch (result.outcome) {
      case RelayOutcome::kCompleted:
        state = RequestState::kCompleted;
        record.outcome = UsageOutcome::kCompleted;
        record.error_kind.clear();
        record.http_status = 200;
        break;
      case RelayOutcome::kClientGone:
        mark_aborted();
        break;
      case RelayOutcome::kUpstreamFailed:
        log::Warn("handler", "stream failed",
                  "request_id=" + call.request_id + " model=" + model +
                      " error=" + ErrorKindId(result.error) +
                      " frames=" + std::to_string(result.data_frames));
        if (!result.started) {
          fail(result.error, result.error_message);
        } else {
          // Head already sent with 200; the error travelled as a frame.
          state = RequestState::kFailed;
          record.outcome = UsageOutcome::kFailed;
          record.error_kind = ErrorKindId(result.error);
          record.http_status = 200;
        }
        break;
    }
    return state;
  } catch (const GatewayError& e) {
    if (e.kind() == ErrorKind::kClientDisconnected) {
      mark_aborted();
    } else {
      log::Debug("handler", "request rejected",
                 "request_id=" + call.request_id +
                     " state=" + RequestStateName(state) +
                     " error=" + ErrorKindId(e.kind()));
      fail(e.kind(), e.what());
    }
  } catch (const std::exception& e) {
    log::Error("handler", "unexpected failure",
               "request_id=" + call.request_id +
                   " state=" + RequestStateName(state) + " error=" + e.what());
    if (state == RequestState::kRelaying) {
      // The stream head may be out; nothing safe to write.
      state = RequestState::kFailed;
    } else {
      fail(ErrorKind::kInternal, "Internal server error");
    }
  }
  return state;
}

}  // namespace modelgate
