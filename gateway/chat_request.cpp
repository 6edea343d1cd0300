#include "gateway/chat_request.h"

#include "gateway/errors.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace modelgate {

namespace {

[[noreturn]] void Invalid(const std::string& message) {
  throw GatewayError(ErrorKind::kInvalidRequest, message);
}

bool IsKnownRole(const std::string& role) {
  return role == "system" || role == "user" || role == "assistant";
}

std::optional<double> ReadUnitInterval(const json& j, const char* field) {
  if (!j.contains(field) || j[field].is_null()) {
    return std::nullopt;
  }
  if (!j[field].is_number()) {
    Invalid(std::string("'") + field + "' must be a number");
  }
  double value = j[field].get<double>();
  if (value < 0.0 || value > 1.0) {
    Invalid(std::string("'") + field + "' must be between 0.0 and 1.0");
  }
  return value;
}

ChatMessage ParseMessage(const json& msg, std::size_t index) {
  const std::string where = "messages[" + std::to_string(index) + "]";
  if (!msg.is_object()) {
    Invalid(where + " must be an object");
  }
  ChatMessage m;
  if (!msg.contains("role") || !msg["role"].is_string()) {
    Invalid(where + ".role must be a string");
  }
  m.role = msg["role"].get<std::string>();
  if (!IsKnownRole(m.role)) {
    Invalid(where + ".role '" + m.role +
            "' is not one of system, user, assistant");
  }
  if (!msg.contains("content") || !msg["content"].is_string()) {
    Invalid(where + ".content must be a string");
  }
  m.content = msg["content"].get<std::string>();
  // "name" has no backend counterpart; it is checked, not forwarded.
  if (msg.contains("name") && !msg["name"].is_null() &&
      !msg["name"].is_string()) {
    Invalid(where + ".name must be a string");
  }
  return m;
}

}  // namespace

InboundRequest ParseChatRequest(const std::string& body) {
  json j;
  try {
    j = json::parse(body);
  } catch (const json::parse_error&) {
    Invalid("Request body is not valid JSON");
  }
  if (!j.is_object()) {
    Invalid("Request body must be a JSON object");
  }

  InboundRequest req;

  if (!j.contains("model") || !j["model"].is_string() ||
      j["model"].get<std::string>().empty()) {
    Invalid("'model' is required and must be a non-empty string");
  }
  req.model = j["model"].get<std::string>();

  if (!j.contains("messages") || !j["messages"].is_array()) {
    Invalid("'messages' is required and must be an array");
  }
  const auto& messages = j["messages"];
  if (messages.empty()) {
    Invalid("'messages' must contain at least one message");
  }
  req.messages.reserve(messages.size());
  for (std::size_t i = 0; i < messages.size(); ++i) {
    req.messages.push_back(ParseMessage(messages[i], i));
  }

  if (j.contains("stream") && !j["stream"].is_null()) {
    if (!j["stream"].is_boolean()) {
      Invalid("'stream' must be a boolean");
    }
    req.stream = j["stream"].get<bool>();
  }

  req.temperature = ReadUnitInterval(j, "temperature");
  req.top_p = ReadUnitInterval(j, "top_p");

  if (j.contains("max_tokens") && !j["max_tokens"].is_null()) {
    if (!j["max_tokens"].is_number_integer()) {
      Invalid("'max_tokens' must be an integer");
    }
    auto max_tokens = j["max_tokens"].get<long long>();
    if (max_tokens <= 0 || max_tokens > 1'000'000) {
      Invalid("'max_tokens' must be a positive integer");
    }
    req.max_tokens = static_cast<int>(max_tokens);
  }

  if (j.contains("stop") && !j["stop"].is_null()) {
    const auto& stop = j["stop"];
    if (stop.is_string()) {
      req.stop.push_back(stop.get<std::string>());
    } else if (stop.is_array()) {
      for (const auto& s : stop) {
        if (!s.is_string()) {
          Invalid("'stop' entries must be strings");
        }
        req.stop.push_back(s.get<std::string>());
      }
    } else {
      Invalid("'stop' must be a string or an array of strings");
    }
  }
  return req;
}

}  // namespace modelgate
