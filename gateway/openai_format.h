#pragma once

#include "gateway/backend_protocol.h"
#include "gateway/errors.h"

#include <ctime>
#include <string>
#include <vector>

namespace modelgate {

// Terminal SSE marker written once after the last data frame.
inline constexpr const char* kSseDoneFrame = "data: [DONE]\n\n";

// Wraps a JSON payload as one server-sent event.
std::string SseFrame(const std::string& payload);

// {"id","object":"chat.completion","created","model","choices":[...],"usage"}
std::string BuildCompletionBody(const std::string& completion_id,
                                const std::string& model, std::time_t created,
                                const BackendEvent& reply);

// One "chat.completion.chunk" object (not framed). The first chunk of a
// stream carries delta.role = "assistant"; a done event carries
// finish_reason.
std::string BuildStreamChunk(const std::string& completion_id,
                             const std::string& model, std::time_t created,
                             const BackendEvent& event, bool first);

// {"error":{"message","type","code"}}
std::string BuildErrorBody(ErrorKind kind, const std::string& message);
// Same shape for HTTP-level refusals that have no ErrorKind.
std::string BuildErrorBody(const std::string& code, const std::string& type,
                           const std::string& message);

// {"object":"list","data":[{"id","object":"model","owned_by",...}]}
std::string BuildModelList(const std::vector<const ModelEntry*>& models);

}  // namespace modelgate
