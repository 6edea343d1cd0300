#include "gateway/openai_format.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace modelgate {

namespace {

json FinishReason(const BackendEvent& event) {
  if (!event.done) {
    return nullptr;
  }
  if (event.done_reason == "length") {
    return "length";
  }
  return "stop";
}

}  // namespace

std::string SseFrame(const std::string& payload) {
  return "data: " + payload + "\n\n";
}

std::string BuildCompletionBody(const std::string& completion_id,
                                const std::string& model, std::time_t created,
                                const BackendEvent& reply) {
  int prompt_tokens = reply.prompt_eval_count.value_or(0);
  int completion_tokens = reply.eval_count.value_or(0);
  json j;
  j["id"] = completion_id;
  j["object"] = "chat.completion";
  j["created"] = created;
  j["model"] = model;
  j["choices"] = json::array(
      {{{"index", 0},
        {"message", {{"role", "assistant"}, {"content", reply.content}}},
        {"finish_reason", FinishReason(reply)}}});
  j["usage"] = {{"prompt_tokens", prompt_tokens},
                {"completion_tokens", completion_tokens},
                {"total_tokens", prompt_tokens + completion_tokens}};
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string BuildStreamChunk(const std::string& completion_id,
                             const std::string& model, std::time_t created,
                             const BackendEvent& event, bool first) {
  json delta = json::object();
  if (first) {
    delta["role"] = "assistant";
  }
  if (!event.content.empty() || !event.done) {
    delta["content"] = event.content;
  }
  json j;
  j["id"] = completion_id;
  j["object"] = "chat.completion.chunk";
  j["created"] = created;
  j["model"] = model;
  j["choices"] = json::array({{{"index", 0},
                               {"delta", std::move(delta)},
                               {"finish_reason", FinishReason(event)}}});
  if (event.done && (event.prompt_eval_count || event.eval_count)) {
    int prompt_tokens = event.prompt_eval_count.value_or(0);
    int completion_tokens = event.eval_count.value_or(0);
    j["usage"] = {{"prompt_tokens", prompt_tokens},
                  {"completion_tokens", completion_tokens},
                  {"total_tokens", prompt_tokens + completion_tokens}};
  }
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string BuildErrorBody(ErrorKind kind, const std::string& message) {
  return BuildErrorBody(ErrorKindId(kind), ErrorKindType(kind), message);
}

std::string BuildErrorBody(const std::string& code, const std::string& type,
                           const std::string& message) {
  json j;
  j["error"] = {{"message", message}, {"type", type}, {"code", code}};
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string BuildModelList(const std::vector<const ModelEntry*>& models) {
  json data = json::array();
  for (const auto* entry : models) {
    json m;
    m["id"] = entry->name;
    m["object"] = "model";
    m["owned_by"] = "modelgate";
    if (entry->default_quant) {
      m["quantization"] = *entry->default_quant;
    }
    data.push_back(std::move(m));
  }
  return json({{"object", "list"}, {"data", std::move(data)}}).dump();
}

}  // namespace modelgate
