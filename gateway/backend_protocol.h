#pragma once

#include "gateway/chat_request.h"
#include "gateway/model_registry.h"

#include <optional>
#include <string>

namespace modelgate {

// Path of the backend's native chat endpoint.
inline constexpr const char* kBackendChatPath = "/api/chat";

// One decoded backend object: the whole buffered reply, or one NDJSON line
// of a streamed reply.
struct BackendEvent {
  std::string content;                   // message.content ("" when absent)
  bool done{false};
  std::string done_reason;               // "stop", "length", ... or ""
  std::optional<int> prompt_eval_count;  // prompt tokens (final event only)
  std::optional<int> eval_count;         // completion tokens (final event)
  std::optional<std::string> error;      // backend-reported failure
};

// Translates an inbound OpenAI body into the backend request body:
//   {"model": <backend tag>, "messages": [...], "stream": bool,
//    "options": {"temperature", "num_predict", "top_p", "stop"}}
std::string BuildBackendRequest(const ModelEntry& backend,
                                const InboundRequest& request);

// Decodes one backend JSON object. Throws GatewayError(kUpstreamError) when
// the text is not a JSON object.
BackendEvent ParseBackendEvent(const std::string& text);

// Pulls a human-readable message out of a backend error body, capped so a
// large HTML error page never reaches the client.
std::string SummarizeBackendError(const std::string& body);

}  // namespace modelgate
