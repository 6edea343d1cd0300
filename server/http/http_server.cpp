#include "server/http/http_server.h"

#include "gateway/errors.h"
#include "gateway/openai_format.h"
#include "gateway/request_id.h"
#include "net/http_client.h"
#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <openssl/err.h>
#include <openssl/ssl.h>

using json = nlohmann::json;

namespace modelgate {

namespace {

std::string Trim(const std::string &value) {
  auto s = value.find_first_not_of(" \t\r\n");
  if (s == std::string::npos)
    return {};
  auto e = value.find_last_not_of(" \t\r\n");
  return value.substr(s, e - s + 1);
}

bool EqualsIgnoreCase(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

// Returns the trimmed value of an HTTP header from the raw header block, or
// empty string if the header is not present. Names match case-insensitively.
std::string GetHeaderValue(const std::string &headers,
                           const std::string &name) {
  std::istringstream lines(headers);
  std::string line;
  while (std::getline(lines, line)) {
    auto colon = line.find(':');
    if (colon == std::string::npos)
      continue;
    if (EqualsIgnoreCase(Trim(line.substr(0, colon)), name)) {
      return Trim(line.substr(colon + 1));
    }
  }
  return {};
}

std::string BuildResponse(const std::string &body, int status,
                          const std::string &content_type,
                          const std::string &extra_headers) {
  std::string headers = "HTTP/1.1 " + std::to_string(status) + " " +
                        HttpStatusText(status) + "\r\n";
  headers += "Content-Type: " + content_type + "\r\n";
  headers += "Access-Control-Allow-Origin: *\r\n";
  headers += "Connection: close\r\n";
  if (!extra_headers.empty()) {
    headers += extra_headers;
  }
  headers += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
  return headers + body;
}

constexpr const char *kChatCompletionsPath = "/v1/chat/completions";
constexpr const char *kBusyMessage = "Server is at capacity, retry shortly";

// Splits "METHOD target HTTP/x.y".
bool ParseRequestLine(const std::string &line, std::string *method,
                      std::string *target) {
  auto method_end = line.find(' ');
  if (method_end == std::string::npos) {
    return false;
  }
  auto target_end = line.find(' ', method_end + 1);
  if (target_end == std::string::npos) {
    return false;
  }
  *method = line.substr(0, method_end);
  *target = line.substr(method_end + 1, target_end - method_end - 1);
  return true;
}

std::string StripQuery(const std::string &target) {
  return target.substr(0, target.find('?'));
}

std::string RefusalBody(int status, const std::string &code,
                        const std::string &message) {
  return BuildErrorBody(code,
                        status >= 500 ? "server_error" : "invalid_request_error",
                        message);
}

} // namespace

class HttpServer::SessionWriter : public ResponseWriter {
public:
  SessionWriter(HttpServer *server, ClientSession *session,
                std::string request_id)
      : server_(server), session_(session),
        request_id_(std::move(request_id)) {}

  const std::string &request_id() const { return request_id_; }

  bool SendResponse(int status, const std::string &content_type,
                    const std::string &body,
                    const std::string &extra_headers) override {
    return server_->SendAll(
        *session_, BuildResponse(body, status, content_type,
                                 "X-Request-ID: " + request_id_ + "\r\n" +
                                     extra_headers));
  }

  bool BeginStream() override {
    std::string stream_headers = "HTTP/1.1 200 OK\r\n"
                                 "Content-Type: text/event-stream\r\n"
                                 "Cache-Control: no-cache\r\n"
                                 "Connection: close\r\n"
                                 "Access-Control-Allow-Origin: *\r\n"
                                 "X-Accel-Buffering: no\r\n"
                                 "X-Request-ID: " +
                                 request_id_ + "\r\n\r\n";
    return server_->SendAll(*session_, stream_headers);
  }

  bool WriteFrame(const std::string &frame) override {
    return server_->SendAll(*session_, frame);
  }

  int WatchFd() const override { return session_->fd; }

private:
  HttpServer *server_;
  ClientSession *session_;
  std::string request_id_;
};

HttpServer::HttpServer(Options options, RequestHandler *handler,
                       const ModelRegistry *registry, const ApiKeyAuth *auth,
                       MetricsRegistry *metrics)
    : options_(std::move(options)), handler_(handler), registry_(registry),
      auth_(auth), metrics_(metrics) {
  if (options_.num_workers <= 0) {
    options_.num_workers = 64;
  }
  options_.max_connections =
      std::max(options_.max_connections, options_.num_workers);
}

HttpServer::~HttpServer() {
  Stop();
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

void HttpServer::Start() {
  if (running_) {
    return;
  }
  const TlsConfig &tls = options_.tls;
  if (tls.enabled && !ssl_ctx_) {
    if (tls.cert_path.empty() || tls.key_path.empty()) {
      throw std::runtime_error("TLS enabled without cert_path/key_path");
    }
    SSL_load_error_strings();
    OpenSSL_add_ssl_algorithms();
    ssl_ctx_ = SSL_CTX_new(TLS_server_method());
    if (!ssl_ctx_) {
      throw std::runtime_error("failed to initialize TLS context");
    }
    SSL_CTX_set_ecdh_auto(ssl_ctx_, 1);
    if (SSL_CTX_use_certificate_file(ssl_ctx_, tls.cert_path.c_str(),
                                     SSL_FILETYPE_PEM) <= 0) {
      SSL_CTX_free(ssl_ctx_);
      ssl_ctx_ = nullptr;
      throw std::runtime_error("failed to load TLS certificate: " +
                               tls.cert_path);
    }
    if (SSL_CTX_use_PrivateKey_file(ssl_ctx_, tls.key_path.c_str(),
                                    SSL_FILETYPE_PEM) <= 0) {
      SSL_CTX_free(ssl_ctx_);
      ssl_ctx_ = nullptr;
      throw std::runtime_error("failed to load TLS key: " + tls.key_path);
    }
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;
  addrinfo *result = nullptr;
  int gai = getaddrinfo(options_.host.c_str(),
                        std::to_string(options_.port).c_str(), &hints, &result);
  if (gai != 0) {
    throw std::runtime_error("cannot resolve listen address " + options_.host +
                             ": " + gai_strerror(gai));
  }
  int fd = -1;
  std::string last_error = "no usable address";
  for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
    fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (fd < 0) {
      last_error = std::strerror(errno);
      continue;
    }
    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    if (::bind(fd, rp->ai_addr, rp->ai_addrlen) == 0 && ::listen(fd, 128) == 0) {
      break;
    }
    last_error = std::strerror(errno);
    ::close(fd);
    fd = -1;
  }
  freeaddrinfo(result);
  if (fd < 0) {
    throw std::runtime_error("cannot listen on " + options_.host + ":" +
                             std::to_string(options_.port) + ": " + last_error);
  }

  sockaddr_storage bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &bound_len) ==
      0) {
    if (bound.ss_family == AF_INET6) {
      bound_port_.store(
          ntohs(reinterpret_cast<sockaddr_in6 *>(&bound)->sin6_port));
    } else {
      bound_port_.store(
          ntohs(reinterpret_cast<sockaddr_in *>(&bound)->sin_port));
    }
  } else {
    bound_port_.store(options_.port);
  }
  server_fd_.store(fd);

  running_ = true;
  for (int i = 0; i < options_.num_workers; ++i) {
    workers_.emplace_back(&HttpServer::WorkerLoop, this, true);
  }
  accept_thread_ = std::thread(&HttpServer::Run, this);
  log::Info("server", "listening",
            "host=" + options_.host + " port=" +
                std::to_string(bound_port_.load()) +
                " workers=" + std::to_string(options_.num_workers) +
                " max_connections=" + std::to_string(options_.max_connections) +
                " tls=" + (ssl_ctx_ ? "on" : "off"));
}

void HttpServer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  // Close the listening socket to unblock the accept() call in Run().
  int fd = server_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  // Wake all worker threads.
  queue_cv_.notify_all();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  for (auto &w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();
  std::vector<std::thread> overflow;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    overflow.swap(overflow_workers_);
    finished_overflow_.clear();
  }
  for (auto &w : overflow) {
    if (w.joinable()) {
      w.join();
    }
  }
  // Drain any remaining clients in the queue.
  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!client_queue_.empty()) {
    auto session = std::move(client_queue_.front());
    client_queue_.pop();
    CloseSession(session);
  }
  log::Info("server", "stopped");
}

void HttpServer::WorkerLoop(bool core) {
  while (true) {
    ClientSession session;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      if (core) {
        ++idle_workers_;
        queue_cv_.wait(lock,
                       [this] { return !client_queue_.empty() || !running_; });
        --idle_workers_;
        if (!running_ && client_queue_.empty()) {
          return;
        }
      } else if (client_queue_.empty()) {
        finished_overflow_.push_back(std::this_thread::get_id());
        return;
      }
      session = std::move(client_queue_.front());
      client_queue_.pop();
    }
    if (session.fd >= 0) {
      HandleClient(session);
      CloseSession(session);
    }
    std::lock_guard<std::mutex> lock(queue_mutex_);
    --open_connections_;
  }
}

void HttpServer::ReapFinishedOverflowLocked() {
  // Finished threads pushed their id under the lock we now hold, so they
  // are past their last use of it and join() returns promptly.
  for (const auto &id : finished_overflow_) {
    auto it = std::find_if(
        overflow_workers_.begin(), overflow_workers_.end(),
        [&id](const std::thread &t) { return t.get_id() == id; });
    if (it != overflow_workers_.end()) {
      it->join();
      overflow_workers_.erase(it);
    }
  }
  finished_overflow_.clear();
}

void HttpServer::Run() {
  int fd = server_fd_.load();
  while (running_) {
    sockaddr_storage client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd =
        ::accept(fd, reinterpret_cast<sockaddr *>(&client_addr), &client_len);
    if (client_fd < 0) {
      if (errno == EINTR && running_) {
        continue;
      }
      break; // Listening socket closed by Stop().
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    ClientSession session;
    session.fd = client_fd;
    bool admitted = false;
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      if (open_connections_ < options_.max_connections) {
        admitted = true;
        ++open_connections_;
        client_queue_.push(std::move(session));
        // More connections waiting than idle workers to take them.
        if (idle_workers_ < static_cast<int>(client_queue_.size())) {
          ReapFinishedOverflowLocked();
          try {
            overflow_workers_.emplace_back(&HttpServer::WorkerLoop, this,
                                           false);
          } catch (const std::system_error &e) {
            log::Warn("server", "cannot start overflow worker",
                      std::string("error=") + e.what());
          }
        }
      }
    }
    if (!admitted) {
      RejectBusy(client_fd);
      continue;
    }
    queue_cv_.notify_one();
  }
}

void HttpServer::RejectBusy(int fd) {
  auto received_at = std::chrono::steady_clock::now();
  if (metrics_) {
    metrics_->RecordRejectedConnection();
  }
  ClientSession session;
  session.fd = fd;
  if (ssl_ctx_) {
    // No handshake on the accept thread; the client only sees the close.
    log::Warn("server", "connection refused at capacity", "tls=on");
    CloseSession(session);
    return;
  }

  // This runs on the accept thread, so every wait is short.
  timeval quick{};
  quick.tv_usec = 200 * 1000;
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &quick, sizeof(quick));
  ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &quick, sizeof(quick));

  // Consume a small request so closing does not reset the reply away.
  constexpr std::size_t kMaxDrainBytes = 64 * 1024;
  std::string head;
  char buffer[4096];
  std::size_t head_end = std::string::npos;
  while ((head_end = head.find("\r\n\r\n")) == std::string::npos &&
         head.size() < kMaxDrainBytes) {
    ssize_t bytes = Receive(session, buffer, sizeof(buffer));
    if (bytes <= 0) {
      break;
    }
    head.append(buffer, static_cast<std::size_t>(bytes));
  }
  std::string method;
  std::string target;
  auto line_end = head.find("\r\n");
  if (line_end != std::string::npos) {
    ParseRequestLine(head.substr(0, line_end), &method, &target);
  }
  std::string headers =
      head_end == std::string::npos || line_end >= head_end
          ? std::string()
          : head.substr(line_end + 2, head_end - line_end - 2);
  std::string length_value = GetHeaderValue(headers, "Content-Length");
  if (head_end != std::string::npos && !length_value.empty() &&
      length_value.size() < 7 &&
      std::all_of(length_value.begin(), length_value.end(),
                  [](unsigned char c) { return std::isdigit(c); })) {
    std::size_t wanted = head_end + 4 + std::stoul(length_value);
    while (head.size() < wanted && head.size() < kMaxDrainBytes) {
      ssize_t bytes = Receive(session, buffer, sizeof(buffer));
      if (bytes <= 0) {
        break;
      }
      head.append(buffer, static_cast<std::size_t>(bytes));
    }
  }
  std::string request_id = GetHeaderValue(headers, "X-Request-ID");
  if (!IsAcceptableRequestId(request_id)) {
    request_id = NewRequestId();
  }
  log::Warn("server", "connection refused at capacity",
            "max_connections=" + std::to_string(options_.max_connections) +
                " request_id=" + request_id);

  SessionWriter writer(this, &session, request_id);
  const std::string retry_after = "Retry-After: 1\r\n";
  if (StripQuery(target) == kChatCompletionsPath) {
    ChatCall call;
    call.request_id = request_id;
    call.received_at = received_at;
    handler_->RejectChatCompletion(call, 503, "server_busy", kBusyMessage,
                                   writer, retry_after);
  } else if (!writer.SendResponse(503, "application/json",
                                  RefusalBody(503, "server_busy", kBusyMessage),
                                  retry_after)) {
    log::Debug("server", "client gone before busy response",
               "request_id=" + request_id);
  }
  CloseSession(session);
}

int HttpServer::ReadRequest(ClientSession &session, ParsedRequest *out) {
  // Dynamically read the full HTTP request: headers + body based on
  // Content-Length or chunked framing.
  constexpr std::size_t kInitialBuf = 4096;
  const std::size_t max_request = options_.max_request_bytes;
  std::string request;
  std::size_t header_end_pos = std::string::npos;
  char buffer[kInitialBuf];

  // Phase 1: read until we find the end-of-headers marker.
  while (header_end_pos == std::string::npos) {
    if (request.size() > max_request) {
      auto line_end = request.find("\r\n");
      if (line_end != std::string::npos) {
        ParseRequestLine(request.substr(0, line_end), &out->method,
                         &out->path);
      }
      return 413;
    }
    ssize_t bytes = Receive(session, buffer, sizeof(buffer));
    if (bytes <= 0) {
      return -1;
    }
    request.append(buffer, static_cast<std::size_t>(bytes));
    header_end_pos = request.find("\r\n\r\n");
  }

  std::string head = request.substr(0, header_end_pos);
  std::string rest = request.substr(header_end_pos + 4);
  auto first_line_end = head.find("\r\n");
  std::string first_line = head.substr(0, first_line_end);
  out->headers = first_line_end == std::string::npos
                     ? std::string()
                     : head.substr(first_line_end + 2);
  if (!ParseRequestLine(first_line, &out->method, &out->path)) {
    return 400;
  }

  // Phase 2: read the body.
  std::string transfer_encoding =
      GetHeaderValue(out->headers, "Transfer-Encoding");
  if (!transfer_encoding.empty()) {
    std::string lowered = transfer_encoding;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lowered != "chunked") {
      return 400;
    }
    net::ChunkedDecoder decoder;
    if (!decoder.Feed(rest.data(), rest.size(), &out->body)) {
      return 400;
    }
    while (!decoder.Finished()) {
      if (out->body.size() > max_request) {
        return 413;
      }
      ssize_t bytes = Receive(session, buffer, sizeof(buffer));
      if (bytes <= 0) {
        return -1;
      }
      if (!decoder.Feed(buffer, static_cast<std::size_t>(bytes), &out->body)) {
        return 400;
      }
    }
    return out->body.size() > max_request ? 413 : 0;
  }

  std::size_t content_length = 0;
  std::string length_value = GetHeaderValue(out->headers, "Content-Length");
  if (!length_value.empty()) {
    if (length_value.size() > 15 ||
        !std::all_of(length_value.begin(), length_value.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
      return 400;
    }
    content_length = static_cast<std::size_t>(std::stoull(length_value));
  }
  if (content_length > max_request) {
    return 413;
  }
  out->body = rest.substr(0, std::min(rest.size(), content_length));
  while (out->body.size() < content_length) {
    ssize_t bytes = Receive(
        session, buffer,
        std::min(sizeof(buffer), content_length - out->body.size()));
    if (bytes <= 0) {
      return -1;
    }
    out->body.append(buffer, static_cast<std::size_t>(bytes));
  }
  return 0;
}

void HttpServer::HandleClient(ClientSession &session) {
  // RAII guard: keep the connection gauge right on all exit paths.
  struct ConnectionGuard {
    MetricsRegistry *metrics;
    ~ConnectionGuard() {
      if (metrics) {
        metrics->DecrementConnections();
      }
    }
  } guard{metrics_};
  if (metrics_) {
    metrics_->IncrementConnections();
  }

  // Bounded socket waits: a stalled reader ends its stream instead of
  // parking the worker forever.
  timeval rcv{};
  rcv.tv_sec = static_cast<time_t>(options_.read_timeout.count());
  ::setsockopt(session.fd, SOL_SOCKET, SO_RCVTIMEO, &rcv, sizeof(rcv));
  timeval snd{};
  snd.tv_sec = static_cast<time_t>(options_.write_timeout.count());
  ::setsockopt(session.fd, SOL_SOCKET, SO_SNDTIMEO, &snd, sizeof(snd));

  if (ssl_ctx_) {
    SSL *ssl = SSL_new(ssl_ctx_);
    if (!ssl) {
      log::Warn("server", "failed to allocate TLS session");
      return;
    }
    SSL_set_fd(ssl, session.fd);
    if (SSL_accept(ssl) != 1) {
      log::Debug("server", "TLS handshake failed");
      SSL_free(ssl);
      return;
    }
    session.ssl = ssl;
  }

  auto received_at = std::chrono::steady_clock::now();
  ParsedRequest request;
  int read_status = ReadRequest(session, &request);
  if (read_status < 0) {
    return;
  }

  std::string request_id = GetHeaderValue(request.headers, "X-Request-ID");
  if (!IsAcceptableRequestId(request_id)) {
    request_id = NewRequestId();
  }
  SessionWriter writer(this, &session, request_id);

  std::string path = StripQuery(request.path);
  ChatCall call;
  call.request_id = request_id;
  call.received_at = received_at;
  // Refusals on the chat route still go through the handler so they are
  // accounted for.
  auto refuse = [&](int status, const std::string &code,
                    const std::string &message,
                    const std::string &extra_headers) {
    if (path == kChatCompletionsPath) {
      handler_->RejectChatCompletion(call, status, code, message, writer,
                                     extra_headers);
      return;
    }
    writer.SendResponse(status, "application/json",
                        RefusalBody(status, code, message), extra_headers);
  };

  if (read_status == 413) {
    refuse(413, "request_too_large", "Request body exceeds the size limit",
           "");
    return;
  }
  if (read_status != 0) {
    refuse(400, "bad_request", "Malformed HTTP request", "");
    return;
  }

  log::Debug("http", "request",
             "method=" + request.method + " path=" + path +
                 " request_id=" + request_id);

  // CORS preflight.
  if (request.method == "OPTIONS") {
    std::string cors_headers =
        "HTTP/1.1 204 No Content\r\n"
        "Access-Control-Allow-Origin: *\r\n"
        "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
        "Access-Control-Allow-Headers: Content-Type, Authorization, "
        "X-Request-ID\r\n"
        "Access-Control-Max-Age: 86400\r\n"
        "X-Request-ID: " +
        request_id +
        "\r\n"
        "Connection: close\r\n"
        "Content-Length: 0\r\n\r\n";
    SendAll(session, cors_headers);
    return;
  }

  auto method_not_allowed = [&](const char *allow) {
    refuse(405, "method_not_allowed",
           "Method " + request.method + " is not allowed on " + path,
           std::string("Allow: ") + allow + "\r\n");
  };

  if (path == "/health") {
    if (request.method != "GET") {
      method_not_allowed("GET");
      return;
    }
    HandleHealth(writer);
    return;
  }
  if (path == "/metrics") {
    if (request.method != "GET") {
      method_not_allowed("GET");
      return;
    }
    HandleMetrics(writer);
    return;
  }
  if (path == "/v1/models") {
    if (request.method != "GET") {
      method_not_allowed("GET");
      return;
    }
    HandleModels(request, writer);
    return;
  }
  if (path == kChatCompletionsPath) {
    if (request.method != "POST") {
      method_not_allowed("POST");
      return;
    }
    call.authorization = GetHeaderValue(request.headers, "Authorization");
    call.body = std::move(request.body);
    handler_->HandleChatCompletion(call, writer);
    return;
  }

  writer.SendResponse(404, "application/json",
                      RefusalBody(404, "not_found", "No route for " + path),
                      "");
}

void HttpServer::HandleHealth(SessionWriter &writer) {
  json body;
  body["status"] = "healthy";
  body["models"] = registry_ ? registry_->Names() : std::vector<std::string>{};
  body["version"] = kModelgateVersion;
  writer.SendResponse(200, "application/json", body.dump(), "");
}

void HttpServer::HandleMetrics(SessionWriter &writer) {
  std::string text = metrics_ ? metrics_->RenderPrometheus() : std::string();
  writer.SendResponse(200, "text/plain; version=0.0.4", text, "");
}

void HttpServer::HandleModels(const ParsedRequest &request,
                              SessionWriter &writer) {
  try {
    Principal principal = auth_->Authenticate(ApiKeyAuth::ExtractBearerToken(
        GetHeaderValue(request.headers, "Authorization")));
    log::Debug("http", "models listed",
               "key_name=" + principal.display_name +
                   " request_id=" + writer.request_id());
  } catch (const GatewayError &e) {
    RequestHandler::SendError(writer, e.kind(), e.what());
    return;
  }
  std::vector<const ModelEntry *> entries;
  if (registry_) {
    for (const auto &name : registry_->Names()) {
      entries.push_back(registry_->Find(name));
    }
  }
  writer.SendResponse(200, "application/json", BuildModelList(entries), "");
}

bool HttpServer::SendAll(ClientSession &session, const std::string &payload) {
  const char *data = payload.c_str();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    int sent = 0;
    if (session.ssl) {
      sent = SSL_write(session.ssl, data, static_cast<int>(remaining));
      if (sent <= 0) {
        // The socket is blocking, so WANT_WRITE only means SO_SNDTIMEO fired.
        return false;
      }
    } else {
      sent = static_cast<int>(
          ::send(session.fd, data, remaining, MSG_NOSIGNAL));
      if (sent <= 0) {
        if (sent < 0 && errno == EINTR) {
          continue;
        }
        // EAGAIN here means SO_SNDTIMEO expired: treat the client as gone.
        return false;
      }
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

ssize_t HttpServer::Receive(ClientSession &session, char *buffer,
                            std::size_t length) {
  if (session.ssl) {
    int received = SSL_read(session.ssl, buffer, static_cast<int>(length));
    return received > 0 ? received : -1;
  }
  while (true) {
    ssize_t received = ::recv(session.fd, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

void HttpServer::CloseSession(ClientSession &session) {
  if (session.ssl) {
    SSL_shutdown(session.ssl);
    SSL_free(session.ssl);
    session.ssl = nullptr;
  }
  if (session.fd >= 0) {
    ::close(session.fd);
    session.fd = -1;
  }
}

} // namespace modelgate
