#include "gateway/backend_protocol.h"

#include "gateway/errors.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace modelgate {

namespace {

constexpr std::size_t kMaxErrorSummary = 512;

std::optional<int> ReadCount(const json& j, const char* field) {
  if (j.contains(field) && j[field].is_number_integer()) {
    return j[field].get<int>();
  }
  return std::nullopt;
}

}  // namespace

std::string BuildBackendRequest(const ModelEntry& backend,
                                const InboundRequest& request) {
  json body;
  body["model"] = backend.UpstreamModel();
  json messages = json::array();
  for (const auto& m : request.messages) {
    messages.push_back({{"role", m.role}, {"content", m.content}});
  }
  body["messages"] = std::move(messages);
  body["stream"] = request.stream;

  json options = json::object();
  if (request.temperature) {
    options["temperature"] = *request.temperature;
  }
  if (request.max_tokens) {
    options["num_predict"] = *request.max_tokens;
  }
  if (request.top_p) {
    options["top_p"] = *request.top_p;
  }
  if (!request.stop.empty()) {
    options["stop"] = request.stop;
  }
  if (!options.empty()) {
    body["options"] = std::move(options);
  }
  return body.dump();
}

BackendEvent ParseBackendEvent(const std::string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error&) {
    throw GatewayError(ErrorKind::kUpstreamError,
                       "Backend returned a malformed response");
  }
  if (!j.is_object()) {
    throw GatewayError(ErrorKind::kUpstreamError,
                       "Backend returned a malformed response");
  }
  BackendEvent event;
  if (j.contains("error")) {
    event.error = j["error"].is_string() ? j["error"].get<std::string>()
                                         : j["error"].dump();
  }
  if (j.contains("message") && j["message"].is_object()) {
    const auto& msg = j["message"];
    if (msg.contains("content") && msg["content"].is_string()) {
      event.content = msg["content"].get<std::string>();
    }
  }
  if (j.contains("done") && j["done"].is_boolean()) {
    event.done = j["done"].get<bool>();
  }
  if (j.contains("done_reason") && j["done_reason"].is_string()) {
    event.done_reason = j["done_reason"].get<std::string>();
  }
  event.prompt_eval_count = ReadCount(j, "prompt_eval_count");
  event.eval_count = ReadCount(j, "eval_count");
  return event;
}

std::string SummarizeBackendError(const std::string& body) {
  std::string summary;
  try {
    auto j = json::parse(body);
    if (j.is_object() && j.contains("error")) {
      summary = j["error"].is_string() ? j["error"].get<std::string>()
                                       : j["error"].dump();
    }
  } catch (const json::parse_error&) {
  }
  if (summary.empty()) {
    summary = body;
  }
  if (summary.size() > kMaxErrorSummary) {
    summary.resize(kMaxErrorSummary);
  }
  return summary;
}

}  // namespace modelgate
