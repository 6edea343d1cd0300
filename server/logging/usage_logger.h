#pragma once

#include "gateway/usage_record.h"

#include <fstream>
#include <mutex>
#include <string>

namespace modelgate {

// Writes usage records as JSON lines to an optional file and summarises each
// one in the application log.
class UsageLogger : public UsageSink {
 public:
  UsageLogger() = default;

  // path: JSON-lines file opened in append mode; empty disables the file.
  // Throws std::runtime_error when a non-empty path cannot be opened.
  explicit UsageLogger(const std::string& path);

  bool FileEnabled() const { return stream_.is_open(); }

  void Emit(const UsageRecord& record) override;

  // The JSON object written for a record (no trailing newline).
  static std::string ToJson(const UsageRecord& record);

 private:
  std::ofstream stream_;
  std::mutex mutex_;
};

}  // namespace modelgate
