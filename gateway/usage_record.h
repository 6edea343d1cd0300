#pragma once

#include <cstdint>
#include <ctime>
#include <string>

namespace modelgate {

enum class UsageOutcome { kCompleted, kFailed, kAborted };

inline const char* UsageOutcomeName(UsageOutcome outcome) {
  switch (outcome) {
    case UsageOutcome::kCompleted:
      return "completed";
    case UsageOutcome::kFailed:
      return "failed";
    case UsageOutcome::kAborted:
      return "aborted";
  }
  return "failed";
}

// One line of accounting per chat completion request, whatever its fate.
struct UsageRecord {
  std::time_t timestamp{0};
  std::string request_id;
  std::string principal;     // Key display name; empty before auth.
  std::string model;         // Requested model; empty before parsing.
  bool stream{false};
  UsageOutcome outcome{UsageOutcome::kFailed};
  std::string error_kind;    // ErrorKindId(), empty on success.
  int http_status{0};
  int tokens_prompt{0};
  int tokens_response{0};
  int64_t latency_ms{0};
};

// Receives exactly one record per request. Implementations must be safe to
// call from many worker threads at once.
class UsageSink {
 public:
  virtual ~UsageSink() = default;
  virtual void Emit(const UsageRecord& record) = 0;
};

}  // namespace modelgate
