#include <catch2/catch.hpp>

#include "server/config/gateway_config.h"

#include <cstdio>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>

#include <unistd.h>

namespace {

// EnvLookup over a fixed map, so tests never touch the real environment.
modelgate::EnvLookup FakeEnv(const std::map<std::string, std::string>& vars) {
  return [vars](const char* name) -> const char* {
    auto it = vars.find(name);
    return it == vars.end() ? nullptr : it->second.c_str();
  };
}

}  // namespace

TEST_CASE("Empty config yields defaults", "[config]") {
  auto config = modelgate::ParseGatewayConfig("");
  REQUIRE(config.server.host == "0.0.0.0");
  REQUIRE(config.server.http_port == 8000);
  REQUIRE(config.server.workers == 64);
  REQUIRE(config.server.max_connections == 1024);
  REQUIRE(config.models.empty());
  REQUIRE(config.api_keys.empty());
  REQUIRE(config.logging.format == "text");
  REQUIRE(config.logging.level == "info");
  REQUIRE_FALSE(config.tls.enabled);
}

TEST_CASE("Config parses every section", "[config]") {
  auto config = modelgate::ParseGatewayConfig(R"(
server:
  host: 127.0.0.1
  http_port: 9000
  workers: 8
  max_connections: 32
  read_timeout: 10
  write_timeout: 20
  max_request_bytes: 1048576
models:
  - name: llama3
    host: gpu-1
    port: 11434
    model: llama3:8b
    quant: Q4_K_M
    timeout: 45
    idle_timeout: 90
    connect_timeout: 2
  - name: mistral
    host: gpu-2
    port: 11435
auth:
  api_keys:
    - sk-plain
    - key: sk-full
      name: team-b
      quota: unlimited
      enabled: false
logging:
  format: json
  level: debug
  usage_log: /var/log/modelgate/usage.jsonl
tls:
  enabled: true
  cert_path: /etc/modelgate/cert.pem
  key_path: /etc/modelgate/key.pem
)");
  REQUIRE(config.server.host == "127.0.0.1");
  REQUIRE(config.server.http_port == 9000);
  REQUIRE(config.server.workers == 8);
  REQUIRE(config.server.max_connections == 32);
  REQUIRE(config.server.read_timeout == std::chrono::seconds(10));
  REQUIRE(config.server.write_timeout == std::chrono::seconds(20));
  REQUIRE(config.server.max_request_bytes == 1048576);

  REQUIRE(config.models.size() == 2);
  const auto& llama = config.models[0];
  REQUIRE(llama.name == "llama3");
  REQUIRE(llama.host == "gpu-1");
  REQUIRE(llama.port == 11434);
  REQUIRE(llama.UpstreamModel() == "llama3:8b");
  REQUIRE(llama.default_quant.value() == "Q4_K_M");
  REQUIRE(llama.request_timeout == std::chrono::seconds(45));
  REQUIRE(llama.idle_timeout == std::chrono::seconds(90));
  REQUIRE(llama.connect_timeout == std::chrono::seconds(2));
  const auto& mistral = config.models[1];
  REQUIRE(mistral.UpstreamModel() == "mistral");
  REQUIRE_FALSE(mistral.default_quant.has_value());
  REQUIRE(mistral.request_timeout == std::chrono::seconds(30));

  REQUIRE(config.api_keys.size() == 2);
  REQUIRE(config.api_keys[0].key == "sk-plain");
  REQUIRE(config.api_keys[0].name == "key-1");
  REQUIRE(config.api_keys[0].enabled);
  REQUIRE(config.api_keys[1].key == "sk-full");
  REQUIRE(config.api_keys[1].name == "team-b");
  REQUIRE_FALSE(config.api_keys[1].enabled);

  REQUIRE(config.logging.format == "json");
  REQUIRE(config.logging.level == "debug");
  REQUIRE(config.logging.usage_log == "/var/log/modelgate/usage.jsonl");
  REQUIRE(config.tls.enabled);
  REQUIRE(config.tls.key_path == "/etc/modelgate/key.pem");
}

TEST_CASE("Config accepts models and keys keyed by name", "[config]") {
  auto config = modelgate::ParseGatewayConfig(R"(
models:
  llama3:
    host: localhost
    port: 11434
auth:
  api_keys:
    sk-one:
      name: first
    sk-two:
)");
  REQUIRE(config.models.size() == 1);
  REQUIRE(config.models[0].name == "llama3");
  REQUIRE(config.api_keys.size() == 2);
  REQUIRE(config.api_keys[0].key == "sk-one");
  REQUIRE(config.api_keys[0].name == "first");
  REQUIRE(config.api_keys[1].key == "sk-two");
  REQUIRE(config.api_keys[1].name == "key-2");
}

TEST_CASE("Config rejects invalid documents", "[config]") {
  REQUIRE_THROWS_AS(modelgate::ParseGatewayConfig("server: [unclosed"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(modelgate::ParseGatewayConfig("- just\n- a list\n"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(
      modelgate::ParseGatewayConfig("models:\n  - name: a\n    host: h\n"),
      std::runtime_error);
  REQUIRE_THROWS_AS(modelgate::ParseGatewayConfig(
                        "models:\n  - name: a\n    port: eleven\n"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(modelgate::ParseGatewayConfig(
                        "models:\n  - name: a\n    port: 1\n    timeout: 0\n"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(modelgate::ParseGatewayConfig("server:\n  workers: 0\n"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(modelgate::ParseGatewayConfig(
                        "server:\n  workers: 8\n  max_connections: 4\n"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(modelgate::ParseGatewayConfig("logging:\n  format: xml\n"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(
      modelgate::ParseGatewayConfig("logging:\n  level: chatty\n"),
      std::runtime_error);
  REQUIRE_THROWS_AS(
      modelgate::ParseGatewayConfig("auth:\n  api_keys:\n    - \"  \"\n"),
      std::runtime_error);
}

TEST_CASE("Config errors name the offending field", "[config]") {
  try {
    modelgate::ParseGatewayConfig("models:\n  - name: a\n    port: eleven\n");
    FAIL("accepted a non-numeric port");
  } catch (const std::runtime_error& e) {
    REQUIRE(std::string(e.what()).find("models[0].port") != std::string::npos);
  }
}

TEST_CASE("Environment overrides the file", "[config]") {
  auto config = modelgate::ParseGatewayConfig(
      "server:\n  http_port: 9000\nauth:\n  api_keys: [sk-file]\n");
  modelgate::ApplyEnvOverrides(
      &config, FakeEnv({{"MODELGATE_HOST", "127.0.0.1"},
                        {"MODELGATE_PORT", "8123"},
                        {"MODELGATE_WORKERS", "4"},
                        {"MODELGATE_API_KEYS", "sk-a, sk-b,,"},
                        {"MODELGATE_USAGE_LOG", "/tmp/usage.jsonl"},
                        {"MODELGATE_LOG_FORMAT", "json"},
                        {"MODELGATE_LOG_LEVEL", "warn"}}));
  REQUIRE(config.server.host == "127.0.0.1");
  REQUIRE(config.server.http_port == 8123);
  REQUIRE(config.server.workers == 4);
  REQUIRE(config.api_keys.size() == 3);
  REQUIRE(config.api_keys[0].key == "sk-file");
  REQUIRE(config.api_keys[1].key == "sk-a");
  REQUIRE(config.api_keys[1].name == "env-key-1");
  REQUIRE(config.api_keys[2].key == "sk-b");
  REQUIRE(config.logging.usage_log == "/tmp/usage.jsonl");
  REQUIRE(config.logging.format == "json");
  REQUIRE(config.logging.level == "warn");
}

TEST_CASE("Environment overrides are validated", "[config]") {
  modelgate::GatewayConfig config;
  REQUIRE_THROWS_AS(
      modelgate::ApplyEnvOverrides(&config,
                                   FakeEnv({{"MODELGATE_PORT", "80x"}})),
      std::runtime_error);
  REQUIRE_THROWS_AS(
      modelgate::ApplyEnvOverrides(&config,
                                   FakeEnv({{"MODELGATE_WORKERS", "-1"}})),
      std::runtime_error);
  REQUIRE_THROWS_AS(
      modelgate::ApplyEnvOverrides(&config,
                                   FakeEnv({{"MODELGATE_LOG_FORMAT", "xml"}})),
      std::runtime_error);
  REQUIRE_NOTHROW(modelgate::ApplyEnvOverrides(&config, FakeEnv({})));
}

TEST_CASE("LoadGatewayConfig reads a file", "[config]") {
  std::string path =
      "/tmp/modelgate_config_" + std::to_string(::getpid()) + ".yaml";
  {
    std::ofstream out(path);
    out << "models:\n  - name: llama3\n    host: localhost\n    port: 11434\n";
  }
  auto config = modelgate::LoadGatewayConfig(path);
  std::remove(path.c_str());
  REQUIRE(config.models.size() == 1);
  REQUIRE_THROWS_AS(modelgate::LoadGatewayConfig(path), std::runtime_error);
}
