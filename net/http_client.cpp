#include "net/http_client.h"

#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstring>
#include <sstream>

namespace modelgate {
namespace net {
namespace {

constexpr std::size_t kMaxHeadBytes = 64 * 1024;
constexpr std::size_t kMaxChunkLine = 1024;

int RemainingMs(Clock::time_point deadline) {
  auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                       deadline - Clock::now())
                       .count();
  if (remaining <= 0)
    return 0;
  return remaining > INT_MAX ? INT_MAX : static_cast<int>(remaining);
}

bool SetNonBlocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0)
    return false;
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Blocks until `fd` is ready for `events`. A hang-up on `watch_fd` wins over
// readiness so a departed client stops the wait immediately.
IoStatus WaitFor(int fd, short events, Clock::time_point deadline,
                 int watch_fd) {
  while (true) {
    int timeout_ms = RemainingMs(deadline);
    if (timeout_ms == 0)
      return IoStatus::kTimeout;
    pollfd fds[2];
    fds[0].fd = fd;
    fds[0].events = events;
    fds[0].revents = 0;
    nfds_t nfds = 1;
    if (watch_fd >= 0) {
      fds[1].fd = watch_fd;
      fds[1].events = POLLRDHUP;
      fds[1].revents = 0;
      nfds = 2;
    }
    int rc = ::poll(fds, nfds, timeout_ms);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      return IoStatus::kError;
    }
    if (rc == 0)
      continue;
    if (nfds == 2 &&
        (fds[1].revents & (POLLRDHUP | POLLHUP | POLLERR | POLLNVAL))) {
      return IoStatus::kCancelled;
    }
    if (fds[0].revents & (events | POLLHUP | POLLERR))
      return IoStatus::kOk;
    if (fds[0].revents & POLLNVAL)
      return IoStatus::kError;
  }
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

std::string Trim(const std::string &value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos)
    return {};
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

} // namespace

const char *IoStatusName(IoStatus status) {
  switch (status) {
  case IoStatus::kOk:
    return "ok";
  case IoStatus::kEof:
    return "eof";
  case IoStatus::kTimeout:
    return "timeout";
  case IoStatus::kError:
    return "error";
  case IoStatus::kCancelled:
    return "cancelled";
  }
  return "unknown";
}

HttpConnection::~HttpConnection() { Close(); }

HttpConnection::HttpConnection(HttpConnection &&other) noexcept
    : fd_(other.fd_) {
  other.fd_ = -1;
}

HttpConnection &HttpConnection::operator=(HttpConnection &&other) noexcept {
  if (this != &other) {
    Close();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void HttpConnection::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

HttpConnection HttpConnection::Connect(const std::string &host, int port,
                                       Clock::time_point deadline) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  int gai = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints,
                        &result);
  if (gai != 0) {
    throw TransportError(IoStatus::kError, std::string("failed to resolve ") +
                                               host + ": " + gai_strerror(gai));
  }

  IoStatus last = IoStatus::kError;
  std::string last_error = "no usable address";
  for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
    HttpConnection conn(::socket(rp->ai_family, rp->ai_socktype,
                                 rp->ai_protocol));
    if (!conn.IsOpen() || !SetNonBlocking(conn.fd())) {
      last_error = std::strerror(errno);
      continue;
    }
    if (::connect(conn.fd(), rp->ai_addr, rp->ai_addrlen) == 0) {
      freeaddrinfo(result);
      return conn;
    }
    if (errno != EINPROGRESS) {
      last_error = std::strerror(errno);
      continue;
    }
    last = WaitFor(conn.fd(), POLLOUT, deadline, -1);
    if (last == IoStatus::kTimeout) {
      last_error = "connect timed out";
      break;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(conn.fd(), SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
      so_error = errno;
    }
    if (last == IoStatus::kOk && so_error == 0) {
      freeaddrinfo(result);
      return conn;
    }
    last = IoStatus::kError;
    last_error = std::strerror(so_error != 0 ? so_error : ECONNREFUSED);
  }
  freeaddrinfo(result);
  throw TransportError(last, "failed to connect to " + host + ":" +
                                 std::to_string(port) + ": " + last_error);
}

IoStatus HttpConnection::SendAll(const std::string &payload,
                                 Clock::time_point deadline) {
  const char *ptr = payload.data();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    ssize_t sent = ::send(fd_, ptr, remaining, MSG_NOSIGNAL);
    if (sent > 0) {
      ptr += sent;
      remaining -= static_cast<std::size_t>(sent);
      continue;
    }
    if (sent < 0 && errno == EINTR)
      continue;
    if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      IoStatus ready = WaitFor(fd_, POLLOUT, deadline, -1);
      if (ready != IoStatus::kOk)
        return ready;
      continue;
    }
    return IoStatus::kError;
  }
  return IoStatus::kOk;
}

IoStatus HttpConnection::Receive(char *buffer, std::size_t length,
                                 ssize_t *received, Clock::time_point deadline,
                                 int watch_fd) {
  *received = 0;
  while (true) {
    IoStatus ready = WaitFor(fd_, POLLIN, deadline, watch_fd);
    if (ready != IoStatus::kOk)
      return ready;
    ssize_t n = ::recv(fd_, buffer, length, 0);
    if (n > 0) {
      *received = n;
      return IoStatus::kOk;
    }
    if (n == 0)
      return IoStatus::kEof;
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
      continue;
    return IoStatus::kError;
  }
}

bool ChunkedDecoder::Feed(const char *data, std::size_t length,
                          std::string *out) {
  std::size_t i = 0;
  while (i < length) {
    switch (state_) {
    case State::kDone:
      return true;
    case State::kSizeLine:
    case State::kTrailer: {
      char c = data[i++];
      if (c != '\n') {
        line_.push_back(c);
        if (line_.size() > kMaxChunkLine)
          return false;
        break;
      }
      std::string line = Trim(line_);
      line_.clear();
      if (state_ == State::kTrailer) {
        if (line.empty())
          state_ = State::kDone;
        break;
      }
      auto ext = line.find(';');
      std::string digits = Trim(line.substr(0, ext));
      if (digits.empty() || digits.size() > 15)
        return false;
      std::size_t size = 0;
      for (char d : digits) {
        if (!std::isxdigit(static_cast<unsigned char>(d)))
          return false;
        size = size * 16 +
               static_cast<std::size_t>(
                   std::isdigit(static_cast<unsigned char>(d))
                       ? d - '0'
                       : std::tolower(static_cast<unsigned char>(d)) - 'a' + 10);
      }
      if (size == 0) {
        state_ = State::kTrailer;
      } else {
        remaining_ = size;
        state_ = State::kData;
      }
      break;
    }
    case State::kData: {
      std::size_t take = std::min(remaining_, length - i);
      out->append(data + i, take);
      i += take;
      remaining_ -= take;
      if (remaining_ == 0)
        state_ = State::kDataEnd;
      break;
    }
    case State::kDataEnd: {
      char c = data[i++];
      if (c == '\r')
        break;
      if (c != '\n')
        return false;
      state_ = State::kSizeLine;
      break;
    }
    }
  }
  return true;
}

std::string HttpResponseHead::Header(const std::string &lower_name) const {
  auto it = headers.find(lower_name);
  return it == headers.end() ? std::string() : it->second;
}

std::string BuildRequest(const HttpRequest &request) {
  std::ostringstream out;
  out << request.method << " " << request.path << " HTTP/1.1\r\n";
  out << "Host: " << request.host << ":" << request.port << "\r\n";
  out << "Content-Length: " << request.body.size() << "\r\n";
  out << "Content-Type: application/json\r\n";
  for (const auto &[key, value] : request.headers) {
    out << key << ": " << value << "\r\n";
  }
  out << "Connection: close\r\n\r\n";
  out << request.body;
  return out.str();
}

bool HttpStream::ParseHead(const std::string &raw) {
  std::istringstream lines(raw);
  std::string status_line;
  if (!std::getline(lines, status_line))
    return false;
  status_line = Trim(status_line);
  if (status_line.rfind("HTTP/", 0) != 0)
    return false;
  auto space = status_line.find(' ');
  if (space == std::string::npos || space + 4 > status_line.size())
    return false;
  std::string code = status_line.substr(space + 1, 3);
  if (!std::all_of(code.begin(), code.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    return false;
  }
  head_.status = std::stoi(code);

  std::string line;
  while (std::getline(lines, line)) {
    line = Trim(line);
    if (line.empty())
      continue;
    auto colon = line.find(':');
    if (colon == std::string::npos)
      return false;
    head_.headers[ToLower(Trim(line.substr(0, colon)))] =
        Trim(line.substr(colon + 1));
  }

  if (head_.status == 204 || head_.status == 304 ||
      (head_.status >= 100 && head_.status < 200)) {
    framing_ = Framing::kContentLength;
    remaining_ = 0;
    body_done_ = true;
    return true;
  }
  if (ToLower(head_.Header("transfer-encoding")).find("chunked") !=
      std::string::npos) {
    framing_ = Framing::kChunked;
    return true;
  }
  std::string length = head_.Header("content-length");
  if (!length.empty()) {
    if (!std::all_of(length.begin(), length.end(),
                     [](unsigned char c) { return std::isdigit(c); }) ||
        length.size() > 15) {
      return false;
    }
    framing_ = Framing::kContentLength;
    remaining_ = static_cast<std::size_t>(std::stoull(length));
    body_done_ = remaining_ == 0;
    return true;
  }
  framing_ = Framing::kUntilClose;
  return true;
}

IoStatus HttpStream::ReadHead(Clock::time_point deadline, int watch_fd) {
  std::string raw;
  char buffer[4096];
  while (true) {
    auto end = raw.find("\r\n\r\n");
    if (end != std::string::npos) {
      pending_ = raw.substr(end + 4);
      if (!ParseHead(raw.substr(0, end)))
        return IoStatus::kError;
      return IoStatus::kOk;
    }
    if (raw.size() > kMaxHeadBytes)
      return IoStatus::kError;
    ssize_t n = 0;
    IoStatus status =
        conn_.Receive(buffer, sizeof(buffer), &n, deadline, watch_fd);
    if (status == IoStatus::kEof)
      return IoStatus::kError; // Closed before a complete head.
    if (status != IoStatus::kOk)
      return status;
    raw.append(buffer, static_cast<std::size_t>(n));
  }
}

bool HttpStream::Consume(const char *data, std::size_t length,
                         std::string *out) {
  switch (framing_) {
  case Framing::kContentLength: {
    std::size_t take = std::min(remaining_, length);
    out->append(data, take);
    remaining_ -= take;
    if (remaining_ == 0)
      body_done_ = true;
    return true;
  }
  case Framing::kChunked:
    if (!chunked_.Feed(data, length, out))
      return false;
    if (chunked_.Finished())
      body_done_ = true;
    return true;
  case Framing::kUntilClose:
    out->append(data, length);
    return true;
  }
  return false;
}

IoStatus HttpStream::ReadBody(std::string *out, Clock::time_point deadline,
                              int watch_fd) {
  std::size_t before = out->size();
  if (!pending_.empty()) {
    std::string pending;
    pending.swap(pending_);
    if (!body_done_ && !Consume(pending.data(), pending.size(), out))
      return IoStatus::kError;
    if (out->size() > before)
      return IoStatus::kOk;
  }
  char buffer[8192];
  while (!body_done_) {
    ssize_t n = 0;
    IoStatus status =
        conn_.Receive(buffer, sizeof(buffer), &n, deadline, watch_fd);
    if (status == IoStatus::kEof) {
      if (framing_ != Framing::kUntilClose)
        return IoStatus::kError; // Declared framing not satisfied.
      body_done_ = true;
      break;
    }
    if (status != IoStatus::kOk)
      return status;
    if (!Consume(buffer, static_cast<std::size_t>(n), out))
      return IoStatus::kError;
    if (out->size() > before)
      return IoStatus::kOk;
  }
  return out->size() > before ? IoStatus::kOk : IoStatus::kEof;
}

IoStatus HttpStream::ReadFullBody(std::string *out, Clock::time_point deadline,
                                  std::size_t max_bytes, int watch_fd) {
  while (true) {
    IoStatus status = ReadBody(out, deadline, watch_fd);
    if (status == IoStatus::kEof)
      return IoStatus::kOk;
    if (status != IoStatus::kOk)
      return status;
    if (out->size() > max_bytes)
      return IoStatus::kError;
  }
}

HttpStream HttpClient::Open(const HttpRequest &request,
                            Clock::time_point connect_deadline,
                            Clock::time_point deadline, int watch_fd) const {
  HttpConnection conn = HttpConnection::Connect(
      request.host, request.port, std::min(connect_deadline, deadline));
  IoStatus sent = conn.SendAll(BuildRequest(request), deadline);
  if (sent != IoStatus::kOk) {
    throw TransportError(sent, std::string("failed to send request: ") +
                                   IoStatusName(sent));
  }
  HttpStream stream(std::move(conn));
  IoStatus head = stream.ReadHead(deadline, watch_fd);
  if (head != IoStatus::kOk) {
    throw TransportError(head, std::string("failed to read response head: ") +
                                   IoStatusName(head));
  }
  return stream;
}

} // namespace net
} // namespace modelgate
