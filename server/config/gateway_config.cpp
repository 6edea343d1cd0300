#include "server/config/gateway_config.h"

#include "server/logging/logger.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace modelgate {

namespace {

std::string Trim(const std::string& input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

// Reads node[key] as T, or returns `fallback` when the key is absent.
template <typename T>
T Get(const YAML::Node& node, const char* key, const std::string& where,
      T fallback) {
  if (!node[key]) {
    return fallback;
  }
  try {
    return node[key].as<T>();
  } catch (const YAML::Exception&) {
    throw std::runtime_error("config: " + where + "." + key +
                             " has the wrong type");
  }
}

std::chrono::seconds GetSeconds(const YAML::Node& node, const char* key,
                                const std::string& where,
                                std::chrono::seconds fallback) {
  int value = Get<int>(node, key, where, static_cast<int>(fallback.count()));
  if (value <= 0) {
    throw std::runtime_error("config: " + where + "." + key +
                             " must be a positive number of seconds");
  }
  return std::chrono::seconds(value);
}

ModelEntry ParseModel(const YAML::Node& node, const std::string& keyed_name,
                      const std::string& where) {
  if (!node.IsMap()) {
    throw std::runtime_error("config: " + where + " must be a mapping");
  }
  ModelEntry entry;
  entry.name = keyed_name.empty()
                   ? Get<std::string>(node, "name", where, "")
                   : keyed_name;
  if (entry.name.empty()) {
    throw std::runtime_error("config: " + where + ".name is required");
  }
  entry.host = Get<std::string>(node, "host", where, entry.host);
  if (!node["port"]) {
    throw std::runtime_error("config: " + where + ".port is required");
  }
  entry.port = Get<int>(node, "port", where, 0);
  entry.backend_model = Get<std::string>(node, "model", where, "");
  if (node["quant"]) {
    entry.default_quant = Get<std::string>(node, "quant", where, "");
  }
  entry.request_timeout =
      GetSeconds(node, "timeout", where, entry.request_timeout);
  entry.idle_timeout =
      GetSeconds(node, "idle_timeout", where, entry.idle_timeout);
  entry.connect_timeout =
      GetSeconds(node, "connect_timeout", where, entry.connect_timeout);
  return entry;
}

ApiKeySettings ParseApiKey(const YAML::Node& node, const std::string& keyed,
                           std::size_t index) {
  std::string where = "auth.api_keys[" + std::to_string(index) + "]";
  ApiKeySettings settings;
  settings.name = "key-" + std::to_string(index + 1);
  if (node.IsScalar()) {  // Simple key string
    settings.key = node.as<std::string>();
  } else if (node.IsMap()) {
    settings.key = keyed.empty() ? Get<std::string>(node, "key", where, "")
                                 : keyed;
    settings.name = Get<std::string>(node, "name", where, settings.name);
    settings.quota = Get<std::string>(node, "quota", where, settings.quota);
    settings.enabled = Get<bool>(node, "enabled", where, settings.enabled);
  } else if (node.IsNull() && !keyed.empty()) {
    settings.key = keyed;
  } else {
    throw std::runtime_error("config: " + where +
                             " must be a string or a mapping");
  }
  if (Trim(settings.key).empty()) {
    throw std::runtime_error("config: " + where + " has an empty key");
  }
  settings.key = Trim(settings.key);
  return settings;
}

void ValidateLogging(const LoggingSettings& logging) {
  std::string format = ToLower(logging.format);
  if (format != "text" && format != "json") {
    throw std::runtime_error("config: logging.format must be text or json");
  }
  log::Level level;
  if (!log::ParseLevel(logging.level, &level)) {
    throw std::runtime_error("config: logging.level '" + logging.level +
                             "' is not a log level");
  }
}

int ParseIntEnv(const char* name, const char* value) {
  try {
    std::size_t used = 0;
    int parsed = std::stoi(value, &used);
    if (used != std::string(value).size()) {
      throw std::invalid_argument(name);
    }
    return parsed;
  } catch (const std::exception&) {
    throw std::runtime_error(std::string(name) + " must be an integer, got '" +
                             value + "'");
  }
}

}  // namespace

GatewayConfig ParseGatewayConfig(const std::string& yaml_text) {
  GatewayConfig config;
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("config: invalid YAML: ") + e.what());
  }
  if (root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw std::runtime_error("config: top level must be a mapping");
  }

  // Server config
  if (const YAML::Node server = root["server"]) {
    auto& s = config.server;
    s.host = Get<std::string>(server, "host", "server", s.host);
    s.http_port = Get<int>(server, "http_port", "server", s.http_port);
    s.workers = Get<int>(server, "workers", "server", s.workers);
    s.max_connections =
        Get<int>(server, "max_connections", "server", s.max_connections);
    s.read_timeout =
        GetSeconds(server, "read_timeout", "server", s.read_timeout);
    s.write_timeout =
        GetSeconds(server, "write_timeout", "server", s.write_timeout);
    s.max_request_bytes = Get<std::size_t>(server, "max_request_bytes",
                                           "server", s.max_request_bytes);
    if (s.workers <= 0) {
      throw std::runtime_error("config: server.workers must be positive");
    }
    if (s.max_connections < s.workers) {
      throw std::runtime_error(
          "config: server.max_connections must be at least server.workers");
    }
  }

  // Models config
  if (const YAML::Node models = root["models"]) {
    if (models.IsSequence()) {
      std::size_t index = 0;
      for (const auto& model_node : models) {
        config.models.push_back(ParseModel(
            model_node, "", "models[" + std::to_string(index++) + "]"));
      }
    } else if (models.IsMap()) {
      for (const auto& item : models) {
        std::string name = item.first.as<std::string>();
        config.models.push_back(
            ParseModel(item.second, name, "models." + name));
      }
    } else if (!models.IsNull()) {
      throw std::runtime_error("config: models must be a list or a mapping");
    }
  }

  // Auth config
  if (const YAML::Node auth = root["auth"]) {
    if (const YAML::Node keys = auth["api_keys"]) {
      std::size_t index = 0;
      if (keys.IsSequence()) {
        for (const auto& key_node : keys) {
          config.api_keys.push_back(ParseApiKey(key_node, "", index++));
        }
      } else if (keys.IsMap()) {
        for (const auto& item : keys) {
          config.api_keys.push_back(ParseApiKey(
              item.second, item.first.as<std::string>(), index++));
        }
      } else if (!keys.IsNull()) {
        throw std::runtime_error(
            "config: auth.api_keys must be a list or a mapping");
      }
    }
  }

  // Logging config
  if (const YAML::Node logging = root["logging"]) {
    auto& l = config.logging;
    l.format = Get<std::string>(logging, "format", "logging", l.format);
    l.level = Get<std::string>(logging, "level", "logging", l.level);
    l.usage_log = Get<std::string>(logging, "usage_log", "logging", l.usage_log);
  }
  ValidateLogging(config.logging);

  // TLS config
  if (const YAML::Node tls = root["tls"]) {
    config.tls.enabled = Get<bool>(tls, "enabled", "tls", false);
    config.tls.cert_path = Get<std::string>(tls, "cert_path", "tls", "");
    config.tls.key_path = Get<std::string>(tls, "key_path", "tls", "");
  }
  return config;
}

GatewayConfig LoadGatewayConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("config: cannot read " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return ParseGatewayConfig(buffer.str());
}

void ApplyEnvOverrides(GatewayConfig* config, const EnvLookup& lookup) {
  if (const char* env_host = lookup("MODELGATE_HOST")) {
    config->server.host = env_host;
  }
  if (const char* env_port = lookup("MODELGATE_PORT")) {
    config->server.http_port = ParseIntEnv("MODELGATE_PORT", env_port);
  }
  if (const char* env_workers = lookup("MODELGATE_WORKERS")) {
    int workers = ParseIntEnv("MODELGATE_WORKERS", env_workers);
    if (workers <= 0) {
      throw std::runtime_error("MODELGATE_WORKERS must be positive");
    }
    config->server.workers = workers;
  }
  if (const char* env_keys = lookup("MODELGATE_API_KEYS")) {
    std::stringstream ss(env_keys);
    std::string key;
    std::size_t index = 0;
    while (std::getline(ss, key, ',')) {
      auto trimmed = Trim(key);
      if (!trimmed.empty()) {
        ApiKeySettings settings;
        settings.key = trimmed;
        settings.name = "env-key-" + std::to_string(++index);
        config->api_keys.push_back(settings);
      }
    }
  }
  if (const char* env_usage = lookup("MODELGATE_USAGE_LOG")) {
    config->logging.usage_log = env_usage;
  }
  if (const char* env_format = lookup("MODELGATE_LOG_FORMAT")) {
    config->logging.format = env_format;
  }
  if (const char* env_level = lookup("MODELGATE_LOG_LEVEL")) {
    config->logging.level = env_level;
  }
  ValidateLogging(config->logging);
}

}  // namespace modelgate
