#include "devtools-fleet/net/HttpProbe.hpp"
#include "devtools-fleet/Logger.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <optional>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

namespace dtfleet {
namespace net {

namespace {

constexpr size_t MAX_RESPONSE = 1024 * 1024; // 1 MB

using Clock = std::chrono::steady_clock;

int millis_left(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - Clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// Closes the descriptor on scope exit
class Socket {
public:
  Socket() : fd_(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)) {}
  ~Socket() {
    if (fd_ >= 0)
      close(fd_);
  }
  Socket(const Socket &) = delete;
  Socket &operator=(const Socket &) = delete;

  int fd() const { return fd_; }

private:
  int fd_;
};

bool resolve_ipv4(const std::string &host, uint16_t port, sockaddr_in &addr) {
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1)
    return true;

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || !result)
    return false;
  addr.sin_addr = reinterpret_cast<sockaddr_in *>(result->ai_addr)->sin_addr;
  freeaddrinfo(result);
  return true;
}

// Non-blocking connect completed within the deadline
bool connect_with_deadline(int fd, const sockaddr_in &addr,
                           Clock::time_point deadline, std::string &error) {
  int flags = fcntl(fd, F_GETFL, 0);
  fcntl(fd, F_SETFL, flags | O_NONBLOCK);

  int rc = connect(fd, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr));
  if (rc == 0)
    return true;
  if (errno != EINPROGRESS) {
    error = std::strerror(errno);
    return false;
  }

  struct pollfd pfd = {fd, POLLOUT, 0};
  int ready = 0;
  do {
    ready = poll(&pfd, 1, millis_left(deadline));
  } while (ready < 0 && errno == EINTR);
  if (ready <= 0) {
    error = "connect timed out";
    return false;
  }

  int so_error = 0;
  socklen_t len = sizeof(so_error);
  getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
  if (so_error != 0) {
    error = std::strerror(so_error);
    return false;
  }
  return true;
}

// Content-Length value from a header block, if present and numeric
std::optional<size_t> parse_content_length(const std::string &headers) {
  std::istringstream in(headers);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    auto colon = line.find(':');
    if (colon == std::string::npos)
      continue;
    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (name != "content-length")
      continue;
    auto value = line.find_first_not_of(" \t", colon + 1);
    if (value == std::string::npos)
      return std::nullopt;
    try {
      return static_cast<size_t>(std::stoul(line.substr(value)));
    } catch (const std::logic_error &) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

} // namespace

bool tcp_connect(const std::string &host, uint16_t port,
                 std::chrono::milliseconds timeout) {
  sockaddr_in addr;
  if (!resolve_ipv4(host, port, addr))
    return false;

  Socket sock;
  if (sock.fd() < 0)
    return false;

  std::string error;
  return connect_with_deadline(sock.fd(), addr, Clock::now() + timeout, error);
}

HttpResponse http_get(const std::string &host, uint16_t port,
                      const std::string &path,
                      std::chrono::milliseconds timeout) {
  HttpResponse response;
  auto deadline = Clock::now() + timeout;

  sockaddr_in addr;
  if (!resolve_ipv4(host, port, addr)) {
    response.error = "cannot resolve " + host;
    return response;
  }

  Socket sock;
  if (sock.fd() < 0) {
    response.error = std::string("socket: ") + std::strerror(errno);
    return response;
  }
  if (!connect_with_deadline(sock.fd(), addr, deadline, response.error))
    return response;

  std::string request = "GET " + path + " HTTP/1.0\r\nHost: " + host + ":" +
                        std::to_string(port) +
                        "\r\nConnection: close\r\n\r\n";
  size_t sent = 0;
  while (sent < request.size()) {
    struct pollfd pfd = {sock.fd(), POLLOUT, 0};
    if (poll(&pfd, 1, millis_left(deadline)) <= 0) {
      response.error = "send timed out";
      return response;
    }
    ssize_t w = send(sock.fd(), request.data() + sent, request.size() - sent,
                     MSG_NOSIGNAL);
    if (w < 0 && (errno == EAGAIN || errno == EINTR))
      continue;
    if (w <= 0) {
      response.error = std::string("send: ") + std::strerror(errno);
      return response;
    }
    sent += static_cast<size_t>(w);
  }

  // Read until the declared body length arrives; without Content-Length the
  // peer's close ends the body.
  std::string raw;
  char buf[4096];
  size_t headers_end = std::string::npos;
  std::optional<size_t> content_length;
  while (raw.size() < MAX_RESPONSE) {
    if (headers_end == std::string::npos) {
      headers_end = raw.find("\r\n\r\n");
      if (headers_end != std::string::npos)
        content_length = parse_content_length(raw.substr(0, headers_end));
    }
    if (content_length && raw.size() >= headers_end + 4 + *content_length)
      break;

    struct pollfd pfd = {sock.fd(), POLLIN, 0};
    int ready = poll(&pfd, 1, millis_left(deadline));
    if (ready < 0 && errno == EINTR)
      continue;
    if (ready <= 0) {
      response.error = "read timed out";
      return response;
    }
    ssize_t r = recv(sock.fd(), buf, sizeof(buf), 0);
    if (r < 0 && (errno == EAGAIN || errno == EINTR))
      continue;
    if (r < 0) {
      response.error = std::string("recv: ") + std::strerror(errno);
      return response;
    }
    if (r == 0)
      break;
    raw.append(buf, static_cast<size_t>(r));
  }

  // Status line: HTTP/1.x <code> <reason>
  auto line_end = raw.find("\r\n");
  std::string status_line = raw.substr(0, line_end);
  auto space = status_line.find(' ');
  if (status_line.compare(0, 5, "HTTP/") != 0 || space == std::string::npos) {
    response.error = "malformed status line";
    return response;
  }
  try {
    response.status = std::stoi(status_line.substr(space + 1, 3));
  } catch (const std::logic_error &) {
    response.error = "malformed status code";
    return response;
  }

  headers_end = raw.find("\r\n\r\n");
  if (headers_end != std::string::npos) {
    response.body = raw.substr(headers_end + 4);
    if (content_length && response.body.size() > *content_length)
      response.body.resize(*content_length);
  }
  response.transport_ok = true;

  LOG_TRACE("HTTP", "GET", "{}:{}{} -> {}", host, port, path, response.status);
  return response;
}

} // namespace net
} // namespace dtfleet
