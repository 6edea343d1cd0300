#pragma once

#include "gateway/model_registry.h"
#include "gateway/request_handler.h"
#include "server/auth/api_key_auth.h"
#include "server/metrics/metrics.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include <openssl/ssl.h>
#include <sys/types.h>

namespace modelgate {

inline constexpr const char* kModelgateVersion = "0.1.0";

// Inbound HTTP/1.1 front door. One accept thread feeds a pool of workers;
// each worker owns a connection for its whole lifetime (one request per
// connection) so a slow stream only ever blocks its own worker. When every
// worker is busy the pool grows by one thread per waiting connection, up to
// max_connections; past that new connections are answered 503.
class HttpServer {
 public:
  struct TlsConfig {
    bool enabled{false};
    std::string cert_path;
    std::string key_path;
  };

  struct Options {
    std::string host{"0.0.0.0"};
    int port{8000};  // 0 picks an ephemeral port; see BoundPort().
    int num_workers{64};      // Threads kept for the server's lifetime.
    int max_connections{1024};  // Served plus queued; raised to num_workers.
    std::chrono::seconds read_timeout{30};
    std::chrono::seconds write_timeout{60};
    std::size_t max_request_bytes{16 * 1024 * 1024};
    TlsConfig tls;
  };

  // `metrics` may be null. The pointers must outlive the server.
  HttpServer(Options options,
             RequestHandler* handler,
             const ModelRegistry* registry,
             const ApiKeyAuth* auth,
             MetricsRegistry* metrics);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and listens synchronously, then starts the accept thread and the
  // workers. Throws std::runtime_error when the socket cannot be bound or
  // TLS is enabled with an unusable certificate or key.
  void Start();
  void Stop();

  bool Running() const { return running_.load(); }
  int BoundPort() const { return bound_port_.load(); }

 private:
  struct ClientSession {
    int fd{-1};
    SSL* ssl{nullptr};
  };

  struct ParsedRequest {
    std::string method;
    std::string path;
    std::string headers;  // Raw header block without the request line.
    std::string body;
  };

  class SessionWriter;

  void Run();
  // Core workers wait for work until Stop(); overflow workers exit once the
  // queue is empty.
  void WorkerLoop(bool core);
  // Joins overflow workers that have exited. Caller holds queue_mutex_.
  void ReapFinishedOverflowLocked();
  // Answers 503 on the accept thread when max_connections is reached.
  void RejectBusy(int fd);
  void HandleClient(ClientSession& session);
  // Reads one request. Returns 0 on success, -1 when the connection died,
  // or the HTTP status (400, 413) the request should be rejected with.
  int ReadRequest(ClientSession& session, ParsedRequest* request);

  void HandleHealth(SessionWriter& writer);
  void HandleMetrics(SessionWriter& writer);
  void HandleModels(const ParsedRequest& request, SessionWriter& writer);

  bool SendAll(ClientSession& session, const std::string& payload);
  ssize_t Receive(ClientSession& session, char* buffer, std::size_t length);
  void CloseSession(ClientSession& session);

  Options options_;
  RequestHandler* handler_;
  const ModelRegistry* registry_;
  const ApiKeyAuth* auth_;
  MetricsRegistry* metrics_;
  SSL_CTX* ssl_ctx_{nullptr};
  std::atomic<bool> running_{false};
  std::atomic<int> server_fd_{-1};
  std::atomic<int> bound_port_{0};
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::queue<ClientSession> client_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  // Guarded by queue_mutex_.
  int idle_workers_{0};
  int open_connections_{0};  // Queued plus being served.
  std::vector<std::thread> overflow_workers_;
  std::vector<std::thread::id> finished_overflow_;
};

}  // namespace modelgate
