#include "server/logging/usage_logger.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

using json = nlohmann::json;

namespace modelgate {

UsageLogger::UsageLogger(const std::string& path) {
  if (!path.empty()) {
    stream_.open(path, std::ios::app);
    if (!stream_.is_open()) {
      throw std::runtime_error("cannot open usage log: " + path);
    }
  }
}

std::string UsageLogger::ToJson(const UsageRecord& record) {
  json j;
  j["timestamp"] = static_cast<int64_t>(record.timestamp);
  j["request_id"] = record.request_id;
  j["principal"] = record.principal;
  j["model"] = record.model;
  j["stream"] = record.stream;
  j["outcome"] = UsageOutcomeName(record.outcome);
  if (record.error_kind.empty()) {
    j["error_kind"] = nullptr;
  } else {
    j["error_kind"] = record.error_kind;
  }
  j["http_status"] = record.http_status;
  j["tokens_prompt"] = record.tokens_prompt;
  j["tokens_response"] = record.tokens_response;
  j["latency_ms"] = record.latency_ms;
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

void UsageLogger::Emit(const UsageRecord& record) {
  std::string extra = "request_id=" + record.request_id +
                      " principal=" + record.principal +
                      " model=" + record.model +
                      " stream=" + (record.stream ? "true" : "false") +
                      " status=" + std::to_string(record.http_status) +
                      " tokens_prompt=" + std::to_string(record.tokens_prompt) +
                      " tokens_response=" +
                      std::to_string(record.tokens_response) +
                      " latency_ms=" + std::to_string(record.latency_ms);
  if (record.outcome == UsageOutcome::kCompleted) {
    log::Info("usage", "request completed", extra);
  } else {
    log::Warn("usage",
              std::string("request ") + UsageOutcomeName(record.outcome),
              extra + " error=" + record.error_kind);
  }

  if (!FileEnabled()) {
    return;
  }
  std::string line = ToJson(record);
  std::lock_guard<std::mutex> lock(mutex_);
  stream_ << line << "\n";
  stream_.flush();
}

}  // namespace modelgate
