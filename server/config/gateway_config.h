#pragma once

#include "gateway/model_registry.h"

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <string>
#include <vector>

namespace modelgate {

struct ServerSettings {
  std::string host{"0.0.0.0"};
  int http_port{8000};
  int workers{64};
  int max_connections{1024};
  std::chrono::seconds read_timeout{30};
  std::chrono::seconds write_timeout{60};
  std::size_t max_request_bytes{16 * 1024 * 1024};
};

struct ApiKeySettings {
  std::string key;
  std::string name;
  std::string quota{"unlimited"};
  bool enabled{true};
};

struct LoggingSettings {
  std::string format{"text"};  // "text" or "json"
  std::string level{"info"};
  std::string usage_log;       // Empty: usage records go to the log only.
};

struct TlsSettings {
  bool enabled{false};
  std::string cert_path;
  std::string key_path;
};

// Everything read at startup. Nothing here changes afterwards.
struct GatewayConfig {
  ServerSettings server;
  std::vector<ModelEntry> models;
  std::vector<ApiKeySettings> api_keys;
  LoggingSettings logging;
  TlsSettings tls;
};

// Parses a YAML document:
//
//   server:  {host, http_port, workers, max_connections, read_timeout,
//             write_timeout, max_request_bytes}
//   models:  - {name, host, port, model, quant, timeout, idle_timeout,
//               connect_timeout}
//            (or a map keyed by name, with the same fields)
//   auth:    {api_keys: ["sk-...", {key, name, quota, enabled}, ...]}
//   logging: {format, level, usage_log}
//   tls:     {enabled, cert_path, key_path}
//
// Throws std::runtime_error naming the offending field.
GatewayConfig ParseGatewayConfig(const std::string& yaml_text);

// Reads and parses `path`. Throws std::runtime_error when the file cannot
// be read or does not parse.
GatewayConfig LoadGatewayConfig(const std::string& path);

// Looks up an environment variable; nullptr when unset.
using EnvLookup = std::function<const char*(const char*)>;

// Applies MODELGATE_HOST, MODELGATE_PORT, MODELGATE_WORKERS,
// MODELGATE_API_KEYS (comma separated, appended), MODELGATE_USAGE_LOG,
// MODELGATE_LOG_FORMAT and MODELGATE_LOG_LEVEL. Throws std::runtime_error
// on a non-numeric port or worker count.
void ApplyEnvOverrides(GatewayConfig* config,
                       const EnvLookup& lookup = [](const char* name) {
                         return static_cast<const char*>(std::getenv(name));
                       });

}  // namespace modelgate
