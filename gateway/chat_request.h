#pragma once

#include <optional>
#include <string>
#include <vector>

namespace modelgate {

struct ChatMessage {
  std::string role;     // "system", "user" or "assistant".
  std::string content;
};

// One parsed POST /v1/chat/completions body. Owned by the handler call that
// parsed it and never shared.
struct InboundRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  bool stream{false};

  // Optional generation parameters forwarded to the backend.
  std::optional<double> temperature;   // 0.0 .. 1.0
  std::optional<int> max_tokens;       // > 0
  std::optional<double> top_p;         // 0.0 .. 1.0
  std::vector<std::string> stop;       // string or array in the body
};

// Parses and validates an OpenAI-style chat body. Throws
// GatewayError(kInvalidRequest) naming the offending field on malformed JSON,
// missing/mistyped fields, unknown roles or out-of-range parameters.
InboundRequest ParseChatRequest(const std::string& body);

}  // namespace modelgate
