#include <catch2/catch.hpp>

#include "fake_backend.h"
#include "gateway/request_handler.h"
#include "gateway/upstream_client.h"
#include "net/http_client.h"
#include "server/http/http_server.h"
#include "test_fakes.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

using json = nlohmann::json;
using modelgate::testing::Chunk;
using modelgate::testing::ChunkedHead;
using modelgate::testing::FakeBackend;
using modelgate::testing::JsonResponse;
using modelgate::testing::RecordingUsageSink;
using modelgate::testing::SleepMs;
using modelgate::testing::WriteAll;

namespace {

std::string NdjsonLine(const std::string& content, bool done) {
  json j;
  j["message"] = {{"role", "assistant"}, {"content", content}};
  j["done"] = done;
  if (done) {
    j["done_reason"] = "stop";
    j["prompt_eval_count"] = 4;
    j["eval_count"] = 3;
  }
  return j.dump() + "\n";
}

// Answers buffered requests with one reply and streamed requests with three
// content lines plus the final line.
void OllamaScript(int fd, const std::string& request) {
  if (request.find("\"stream\":true") != std::string::npos) {
    WriteAll(fd, ChunkedHead());
    for (const char* piece : {"Hel", "lo", "!"}) {
      WriteAll(fd, Chunk(NdjsonLine(piece, false)));
    }
    WriteAll(fd, Chunk(NdjsonLine("", true)));
    WriteAll(fd, "0\r\n\r\n");
    return;
  }
  json reply;
  reply["message"] = {{"role", "assistant"}, {"content", "Hello!"}};
  reply["done"] = true;
  reply["done_reason"] = "stop";
  reply["prompt_eval_count"] = 4;
  reply["eval_count"] = 2;
  WriteAll(fd, JsonResponse(200, reply.dump()));
}

// Streams 30 content lines 100ms apart, then the final line.
void SlowStreamScript(int fd, const std::string&) {
  WriteAll(fd, ChunkedHead());
  for (int i = 0; i < 30; ++i) {
    if (!WriteAll(fd, Chunk(NdjsonLine("tok", false)))) {
      return;
    }
    SleepMs(100);
  }
  WriteAll(fd, Chunk(NdjsonLine("", true)));
  WriteAll(fd, "0\r\n\r\n");
}

struct Gateway {
  using Tune = std::function<void(modelgate::HttpServer::Options&)>;

  explicit Gateway(FakeBackend::Script script, const Tune& tune = nullptr)
      : backend(std::move(script)) {
    modelgate::ModelEntry llama;
    llama.name = "llama3";
    llama.host = "127.0.0.1";
    llama.port = backend.port();
    llama.request_timeout = std::chrono::seconds(5);
    llama.idle_timeout = std::chrono::seconds(5);
    registry = modelgate::ModelRegistry({llama});
    auth.AddKey("sk-test", "team-a");
    handler = std::make_unique<modelgate::RequestHandler>(
        &registry, &auth, &upstream, &usage, &metrics);
    modelgate::HttpServer::Options options;
    options.host = "127.0.0.1";
    options.port = 0;
    options.num_workers = 4;
    options.read_timeout = std::chrono::seconds(5);
    options.write_timeout = std::chrono::seconds(5);
    options.max_request_bytes = 64 * 1024;
    if (tune) {
      tune(options);
    }
    server = std::make_unique<modelgate::HttpServer>(
        options, handler.get(), &registry, &auth, &metrics);
    server->Start();
  }

  ~Gateway() { server->Stop(); }

  modelgate::testing::FetchedResponse Send(const std::string& method,
                                    const std::string& path,
                                    const std::string& body = {},
                                    bool authorized = true) {
    modelgate::net::HttpRequest request;
    request.method = method;
    request.host = "127.0.0.1";
    request.port = server->BoundPort();
    request.path = path;
    request.body = body;
    if (authorized) {
      request.headers["Authorization"] = "Bearer sk-test";
    }
    auto now = modelgate::net::Clock::now();
    return modelgate::testing::Fetch(
        request, now + std::chrono::seconds(2), now + std::chrono::seconds(10));
  }

  // Waits for the worker to emit the usage record.
  std::vector<modelgate::UsageRecord> WaitForUsage(std::size_t count) {
    for (int i = 0; i < 200; ++i) {
      auto records = usage.Snapshot();
      if (records.size() >= count) {
        return records;
      }
      SleepMs(10);
    }
    return usage.Snapshot();
  }

  FakeBackend backend;
  modelgate::ModelRegistry registry;
  modelgate::ApiKeyAuth auth;
  modelgate::UpstreamClient upstream;
  RecordingUsageSink usage;
  modelgate::MetricsRegistry metrics;
  std::unique_ptr<modelgate::RequestHandler> handler;
  std::unique_ptr<modelgate::HttpServer> server;
};

int ConnectTo(int port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(static_cast<uint16_t>(port));
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    ::close(fd);
    return -1;
  }
  return fd;
}

// Writes `raw` and returns everything the server sends before closing.
std::string RawExchange(int port, const std::string& raw) {
  int fd = ConnectTo(port);
  REQUIRE(fd >= 0);
  REQUIRE(WriteAll(fd, raw));
  std::string reply;
  char buf[4096];
  ssize_t n;
  while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
    reply.append(buf, static_cast<std::size_t>(n));
  }
  ::close(fd);
  return reply;
}

constexpr const char* kChatBody =
    R"({"model":"llama3","messages":[{"role":"user","content":"hi"}]})";
constexpr const char* kStreamBody =
    R"({"model":"llama3","stream":true,"messages":[{"role":"user","content":"hi"}]})";

// Starts a streaming completion on a raw socket and returns once the first
// bytes are back. The caller closes the socket.
int OpenStream(int port) {
  int fd = ConnectTo(port);
  REQUIRE(fd >= 0);
  std::string body = kStreamBody;
  REQUIRE(WriteAll(fd,
                   "POST /v1/chat/completions HTTP/1.1\r\nHost: test\r\n"
                   "Authorization: Bearer sk-test\r\n"
                   "Content-Type: application/json\r\nContent-Length: " +
                       std::to_string(body.size()) + "\r\n\r\n" + body));
  char buf[1024];
  REQUIRE(::recv(fd, buf, sizeof(buf), 0) > 0);
  return fd;
}

long long ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - since)
      .count();
}

}  // namespace

TEST_CASE("HttpServer binds an ephemeral port", "[http_server]") {
  Gateway gw(OllamaScript);
  REQUIRE(gw.server->Running());
  REQUIRE(gw.server->BoundPort() > 0);
}

TEST_CASE("HttpServer answers /health without auth", "[http_server]") {
  Gateway gw(OllamaScript);
  auto response = gw.Send("GET", "/health", {}, false);
  REQUIRE(response.status == 200);
  auto body = json::parse(response.body);
  REQUIRE(body["status"] == "healthy");
  REQUIRE(body["models"] == json::array({"llama3"}));
  REQUIRE(body["version"] == modelgate::kModelgateVersion);
}

TEST_CASE("HttpServer lists models for authorized callers",
          "[http_server]") {
  Gateway gw(OllamaScript);
  auto denied = gw.Send("GET", "/v1/models", {}, false);
  REQUIRE(denied.status == 401);
  REQUIRE(denied.headers.at("www-authenticate") == "Bearer");

  auto listed = gw.Send("GET", "/v1/models");
  REQUIRE(listed.status == 200);
  auto body = json::parse(listed.body);
  REQUIRE(body["data"][0]["id"] == "llama3");
}

TEST_CASE("HttpServer relays a buffered completion", "[http_server]") {
  Gateway gw(OllamaScript);
  auto response = gw.Send("POST", "/v1/chat/completions", kChatBody);
  REQUIRE(response.status == 200);
  REQUIRE(response.headers.at("content-type") == "application/json");
  std::string request_id = response.headers.at("x-request-id");
  REQUIRE(request_id.size() == 32);
  auto body = json::parse(response.body);
  REQUIRE(body["id"] == "chatcmpl-" + request_id);
  REQUIRE(body["choices"][0]["message"]["content"] == "Hello!");
  REQUIRE(body["usage"]["total_tokens"] == 6);

  auto records = gw.WaitForUsage(1);
  REQUIRE(records.size() == 1);
  REQUIRE(records[0].request_id == request_id);
  REQUIRE(records[0].outcome == modelgate::UsageOutcome::kCompleted);
}

TEST_CASE("HttpServer relays a stream as server-sent events",
          "[http_server]") {
  Gateway gw(OllamaScript);
  auto response = gw.Send("POST", "/v1/chat/completions", kStreamBody);
  REQUIRE(response.status == 200);
  REQUIRE(response.headers.at("content-type") == "text/event-stream");

  std::vector<std::string> payloads;
  std::size_t pos = 0;
  while ((pos = response.body.find("data: ", pos)) != std::string::npos) {
    auto end = response.body.find("\n\n", pos);
    REQUIRE(end != std::string::npos);
    payloads.push_back(response.body.substr(pos + 6, end - pos - 6));
    pos = end + 2;
  }
  REQUIRE(payloads.size() == 5);
  REQUIRE(payloads.back() == "[DONE]");
  std::string text;
  for (std::size_t i = 0; i + 1 < payloads.size(); ++i) {
    auto chunk = json::parse(payloads[i]);
    REQUIRE(chunk["object"] == "chat.completion.chunk");
    if (chunk["choices"][0]["delta"].contains("content")) {
      text += chunk["choices"][0]["delta"]["content"].get<std::string>();
    }
  }
  REQUIRE(text == "Hello!");

  auto records = gw.WaitForUsage(1);
  REQUIRE(records.size() == 1);
  REQUIRE(records[0].stream);
  REQUIRE(records[0].tokens_response == 3);
}

TEST_CASE("HttpServer echoes a caller-supplied request id", "[http_server]") {
  Gateway gw(OllamaScript);
  modelgate::net::HttpRequest request;
  request.method = "GET";
  request.host = "127.0.0.1";
  request.port = gw.server->BoundPort();
  request.path = "/health";
  request.headers["X-Request-ID"] = "trace-42";
  auto now = modelgate::net::Clock::now();
  auto response = modelgate::testing::Fetch(
      request, now + std::chrono::seconds(2), now + std::chrono::seconds(5));
  REQUIRE(response.headers.at("x-request-id") == "trace-42");
}

TEST_CASE("HttpServer rejects unknown routes and methods", "[http_server]") {
  Gateway gw(OllamaScript);
  auto missing = gw.Send("GET", "/v2/nothing");
  REQUIRE(missing.status == 404);

  auto wrong = gw.Send("GET", "/v1/chat/completions");
  REQUIRE(wrong.status == 405);
  REQUIRE(wrong.headers.at("allow") == "POST");

  auto preflight = gw.Send("OPTIONS", "/v1/chat/completions");
  REQUIRE(preflight.status == 204);
  REQUIRE(preflight.headers.at("access-control-allow-origin") == "*");
}

TEST_CASE("HttpServer maps gateway errors onto statuses", "[http_server]") {
  Gateway gw(OllamaScript);
  auto unauthorized =
      gw.Send("POST", "/v1/chat/completions", kChatBody, false);
  REQUIRE(unauthorized.status == 401);
  auto unknown = gw.Send(
      "POST", "/v1/chat/completions",
      R"({"model":"gpt-4","messages":[{"role":"user","content":"hi"}]})");
  REQUIRE(unknown.status == 404);
  REQUIRE(json::parse(unknown.body)["error"]["code"] == "unknown_model");
  auto invalid = gw.Send("POST", "/v1/chat/completions", "{");
  REQUIRE(invalid.status == 400);
  REQUIRE(gw.backend.connections() == 0);
}

TEST_CASE("HttpServer rejects oversized and malformed requests",
          "[http_server]") {
  Gateway gw(OllamaScript);
  auto too_big = RawExchange(gw.server->BoundPort(),
                             "POST /v1/chat/completions HTTP/1.1\r\n"
                             "Host: test\r\nContent-Length: 131072\r\n\r\n");
  REQUIRE(too_big.rfind("HTTP/1.1 413 ", 0) == 0);
  REQUIRE(too_big.find("request_too_large") != std::string::npos);

  auto garbage = RawExchange(gw.server->BoundPort(), "HELLO\r\n\r\n");
  REQUIRE(garbage.rfind("HTTP/1.1 400 ", 0) == 0);

  auto bad_length = RawExchange(gw.server->BoundPort(),
                                "POST /v1/chat/completions HTTP/1.1\r\n"
                                "Content-Length: ten\r\n\r\n");
  REQUIRE(bad_length.rfind("HTTP/1.1 400 ", 0) == 0);
  REQUIRE(gw.backend.connections() == 0);
}

TEST_CASE("HttpServer records usage for chat requests it refuses",
          "[http_server]") {
  Gateway gw(OllamaScript);
  auto too_big = RawExchange(gw.server->BoundPort(),
                             "POST /v1/chat/completions HTTP/1.1\r\n"
                             "Host: test\r\nX-Request-ID: big-1\r\n"
                             "Content-Length: 131072\r\n\r\n");
  REQUIRE(too_big.rfind("HTTP/1.1 413 ", 0) == 0);
  auto records = gw.WaitForUsage(1);
  REQUIRE(records.size() == 1);
  REQUIRE(records[0].request_id == "big-1");
  REQUIRE(records[0].error_kind == "request_too_large");
  REQUIRE(records[0].http_status == 413);

  auto wrong = gw.Send("GET", "/v1/chat/completions");
  REQUIRE(wrong.status == 405);
  records = gw.WaitForUsage(2);
  REQUIRE(records.size() == 2);
  REQUIRE(records[1].error_kind == "method_not_allowed");
  REQUIRE(records[1].http_status == 405);

  // Refusals off the chat route are not chat requests.
  RawExchange(gw.server->BoundPort(),
              "POST /health HTTP/1.1\r\nContent-Length: 131072\r\n\r\n");
  SleepMs(100);
  REQUIRE(gw.usage.Snapshot().size() == 2);
  REQUIRE(gw.backend.connections() == 0);
}

TEST_CASE("HttpServer keeps answering while every core worker streams",
          "[http_server]") {
  Gateway gw(SlowStreamScript, [](modelgate::HttpServer::Options& options) {
    options.num_workers = 2;
  });
  int first = OpenStream(gw.server->BoundPort());
  int second = OpenStream(gw.server->BoundPort());

  auto started = std::chrono::steady_clock::now();
  auto health = gw.Send("GET", "/health", {}, false);
  REQUIRE(health.status == 200);
  REQUIRE(ElapsedMs(started) < 1000);

  ::close(first);
  ::close(second);
  REQUIRE(gw.WaitForUsage(2).size() == 2);
}

TEST_CASE("HttpServer answers 503 once max_connections is reached",
          "[http_server]") {
  Gateway gw(SlowStreamScript, [](modelgate::HttpServer::Options& options) {
    options.num_workers = 1;
    options.max_connections = 1;
  });
  int stream = OpenStream(gw.server->BoundPort());

  auto started = std::chrono::steady_clock::now();
  auto health = gw.Send("GET", "/health", {}, false);
  REQUIRE(health.status == 503);
  REQUIRE(health.headers.at("retry-after") == "1");
  REQUIRE(json::parse(health.body)["error"]["code"] == "server_busy");
  REQUIRE(ElapsedMs(started) < 1000);

  auto chat = gw.Send("POST", "/v1/chat/completions", kChatBody);
  REQUIRE(chat.status == 503);
  auto records = gw.WaitForUsage(1);
  REQUIRE(records.size() == 1);
  REQUIRE(records[0].error_kind == "server_busy");
  REQUIRE(records[0].http_status == 503);
  REQUIRE(gw.metrics.RenderPrometheus().find(
              "modelgate_connections_rejected_total 2") != std::string::npos);

  ::close(stream);
  REQUIRE(gw.WaitForUsage(2).size() == 2);
}

TEST_CASE("HttpServer reports a failing backend as 502", "[http_server]") {
  Gateway gw([](int fd, const std::string&) {
    WriteAll(fd, JsonResponse(503, R"({"error":"loading model"})"));
  });
  auto response = gw.Send("POST", "/v1/chat/completions", kChatBody);
  REQUIRE(response.status == 502);
  auto error = json::parse(response.body)["error"];
  REQUIRE(error["code"] == "upstream_error");
  REQUIRE(error["message"].get<std::string>().find("127.0.0.1") ==
          std::string::npos);
}

TEST_CASE("HttpServer aborts the backend when the client leaves",
          "[http_server]") {
  // Declared before the gateway so they outlive the backend's threads.
  std::atomic<int> written{0};
  std::atomic<bool> backend_done{false};
  Gateway gw([&written, &backend_done](int fd, const std::string&) {
    WriteAll(fd, ChunkedHead());
    for (int i = 0; i < 300; ++i) {
      if (!WriteAll(fd, Chunk(NdjsonLine("tok", false)))) {
        break;
      }
      ++written;
      SleepMs(10);
    }
    backend_done = true;
  });

  int client = OpenStream(gw.server->BoundPort());
  ::close(client);

  auto records = gw.WaitForUsage(1);
  REQUIRE(records.size() == 1);
  REQUIRE(records[0].outcome == modelgate::UsageOutcome::kAborted);
  REQUIRE(records[0].error_kind == "client_disconnected");
  REQUIRE(records[0].http_status == 499);

  // The gateway closed its backend connection, so the backend's writes
  // start failing long before its 300 lines are out.
  for (int i = 0; i < 200 && !backend_done; ++i) {
    SleepMs(10);
  }
  REQUIRE(backend_done);
  REQUIRE(written < 100);
}

TEST_CASE("HttpServer exposes Prometheus metrics", "[http_server]") {
  Gateway gw(OllamaScript);
  gw.Send("POST", "/v1/chat/completions", kChatBody);
  gw.WaitForUsage(1);
  auto response = gw.Send("GET", "/metrics", {}, false);
  REQUIRE(response.status == 200);
  REQUIRE(response.body.find(
              "modelgate_requests_total{outcome=\"completed\"} 1") !=
          std::string::npos);
  REQUIRE(response.body.find("modelgate_model_requests_total{model=\"llama3\"}") !=
          std::string::npos);
}

TEST_CASE("HttpServer refuses to start on a taken port", "[http_server]") {
  Gateway gw(OllamaScript);
  modelgate::HttpServer::Options options;
  options.host = "127.0.0.1";
  options.port = gw.server->BoundPort();
  options.num_workers = 1;
  modelgate::HttpServer second(options, gw.handler.get(), &gw.registry,
                               &gw.auth, nullptr);
  REQUIRE_THROWS_AS(second.Start(), std::runtime_error);
  REQUIRE_FALSE(second.Running());
}
