#include "gateway/model_registry.h"
#include "gateway/request_handler.h"
#include "gateway/upstream_client.h"
#include "server/auth/api_key_auth.h"
#include "server/config/gateway_config.h"
#include "server/http/http_server.h"
#include "server/logging/logger.h"
#include "server/logging/usage_logger.h"
#include "server/metrics/metrics.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> g_running{true};

void SignalHandler(int) { g_running = false; }

namespace {

void PrintUsage(const char* argv0) {
  std::cout << "usage: " << argv0 << " [--config PATH]\n"
            << "  --config PATH  YAML configuration (default "
               "config/gateway.yaml)\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path = "config/gateway.yaml";
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      PrintUsage(argv[0]);
      return 2;
    }
  }

  modelgate::GatewayConfig config;
  try {
    if (std::filesystem::exists(config_path)) {
      config = modelgate::LoadGatewayConfig(config_path);
    } else {
      modelgate::log::Warn("main", "config file not found, using defaults",
                           "path=" + config_path);
    }
    modelgate::ApplyEnvOverrides(&config);
  } catch (const std::exception& e) {
    modelgate::log::Error("main", "invalid configuration", e.what());
    return 1;
  }

  modelgate::log::SetJsonMode(config.logging.format == "json");
  modelgate::log::Level level = modelgate::log::Level::INFO;
  if (modelgate::log::ParseLevel(config.logging.level, &level)) {
    modelgate::log::SetMinLevel(level);
  }

  std::unique_ptr<modelgate::ModelRegistry> registry;
  modelgate::ApiKeyAuth auth;
  std::unique_ptr<modelgate::UsageLogger> usage_logger;
  try {
    registry = std::make_unique<modelgate::ModelRegistry>(config.models);
    for (const auto& entry : config.api_keys) {
      auth.AddKey(entry.key, entry.name, modelgate::ParseQuota(entry.quota),
                  entry.enabled);
    }
    usage_logger =
        std::make_unique<modelgate::UsageLogger>(config.logging.usage_log);
  } catch (const std::exception& e) {
    modelgate::log::Error("main", "startup failed", e.what());
    return 1;
  }

  if (registry->Empty()) {
    modelgate::log::Warn("main", "no models configured; every chat request "
                                 "will fail with unknown_model");
  }
  for (const auto& name : registry->Names()) {
    const auto& entry = registry->Resolve(name);
    modelgate::log::Info("main", "model registered",
                         "name=" + entry.name + " backend=" + entry.host + ":" +
                             std::to_string(entry.port) +
                             " upstream_model=" + entry.UpstreamModel());
  }
  if (!auth.HasKeys()) {
    modelgate::log::Warn("main", "no API keys configured; every authenticated "
                                 "request will be rejected");
  }

  auto& metrics = modelgate::GlobalMetrics();
  modelgate::UpstreamClient upstream;
  modelgate::RequestHandler handler(registry.get(), &auth, &upstream,
                                    usage_logger.get(), &metrics);

  modelgate::HttpServer::Options options;
  options.host = config.server.host;
  options.port = config.server.http_port;
  options.num_workers = config.server.workers;
  options.max_connections = config.server.max_connections;
  options.read_timeout = config.server.read_timeout;
  options.write_timeout = config.server.write_timeout;
  options.max_request_bytes = config.server.max_request_bytes;
  options.tls.enabled = config.tls.enabled;
  options.tls.cert_path = config.tls.cert_path;
  options.tls.key_path = config.tls.key_path;
  modelgate::HttpServer server(options, &handler, registry.get(), &auth,
                               &metrics);

  // Client hang-ups surface as failed writes, not signals.
  std::signal(SIGPIPE, SIG_IGN);
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  try {
    server.Start();
  } catch (const std::exception& e) {
    modelgate::log::Error("main", "failed to start server", e.what());
    return 1;
  }
  modelgate::log::Info("main", "modelgate started",
                       "version=" + std::string(modelgate::kModelgateVersion) +
                           " models=" + std::to_string(registry->Size()) +
                           " keys=" + std::to_string(auth.Size()));

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  server.Stop();
  modelgate::log::Info("main", "modelgate shutting down");
  return 0;
}
