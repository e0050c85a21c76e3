#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace dtfleet {
namespace net {

struct HttpResponse {
  bool transport_ok{false}; // connected, sent, and read a status line
  int status{0};
  std::string body;
  std::string error;

  bool success() const {
    return transport_ok && status >= 200 && status < 300;
  }
};

/// TCP connect test bounded by `timeout`.
bool tcp_connect(const std::string &host, uint16_t port,
                 std::chrono::milliseconds timeout);

/// Minimal HTTP/1.0 GET. The body ends after Content-Length bytes, or when the
/// peer closes if the header is absent. The whole exchange is bounded by
/// `timeout`.
HttpResponse http_get(const std::string &host, uint16_t port,
                      const std::string &path,
                      std::chrono::milliseconds timeout);

} // namespace net
} // namespace dtfleet
