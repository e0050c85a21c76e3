#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

// Stand-in for a browser started with --remote-debugging-port. Serves
// /json/version, /json/list and /health. Unknown browser flags are ignored.
//
// Test switches:
//   --fake-exit-immediately   print an error and exit 1
//   --fake-never-ready        never open the debugging port
//   --fake-ignore-sigterm     survive SIGTERM (needs SIGKILL)
//   --fake-ready-delay-ms=N   open the port after N ms
//   --fake-keep-alive         hold each connection open after responding

static std::atomic<bool> g_stop{false};
static bool g_keep_alive = false;

static void handle_term(int) { g_stop = true; }

static bool starts_with(const std::string &s, const std::string &prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

static void send_response(int fd, int status, const std::string &body) {
  std::string reason = status == 200 ? "OK" : "Not Found";
  std::string resp = "HTTP/1.1 " + std::to_string(status) + " " + reason +
                     "\r\nContent-Type: application/json\r\nContent-Length: " +
                     std::to_string(body.size()) +
                     (g_keep_alive ? "\r\nConnection: keep-alive\r\n\r\n"
                                   : "\r\nConnection: close\r\n\r\n") +
                     body;
  size_t sent = 0;
  while (sent < resp.size()) {
    ssize_t w = send(fd, resp.data() + sent, resp.size() - sent, MSG_NOSIGNAL);
    if (w <= 0)
      break;
    sent += static_cast<size_t>(w);
  }
}

static void serve_client(int fd, int port) {
  std::string request;
  char buf[1024];
  while (request.find("\r\n\r\n") == std::string::npos &&
         request.size() < 16 * 1024) {
    struct pollfd pfd = {fd, POLLIN, 0};
    if (poll(&pfd, 1, 2000) <= 0)
      return;
    ssize_t r = recv(fd, buf, sizeof(buf), 0);
    if (r <= 0)
      return;
    request.append(buf, static_cast<size_t>(r));
  }

  // "GET /path HTTP/1.x"
  auto first_space = request.find(' ');
  auto second_space = request.find(' ', first_space + 1);
  std::string path = request.substr(first_space + 1,
                                    second_space - first_space - 1);

  if (path == "/json/version") {
    send_response(fd, 200,
                  "{\"Browser\":\"FakeChrome/1.0\",\"Protocol-Version\":\"1.3\","
                  "\"webSocketDebuggerUrl\":\"ws://127.0.0.1:" +
                      std::to_string(port) + "/devtools/browser/fake\"}");
  } else if (path == "/json/list" || path == "/json") {
    send_response(fd, 200, "[]");
  } else if (path == "/health") {
    send_response(fd, 200, "{\"status\":\"ok\"}");
  } else {
    send_response(fd, 404, "{\"error\":\"not found\"}");
  }
}

int main(int argc, char **argv) {
  int port = 0;
  std::string address = "127.0.0.1";
  bool exit_immediately = false;
  bool never_ready = false;
  bool ignore_sigterm = false;
  int ready_delay_ms = 0;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (starts_with(arg, "--remote-debugging-port=")) {
      port = std::atoi(arg.c_str() + strlen("--remote-debugging-port="));
    } else if (starts_with(arg, "--remote-debugging-address=")) {
      address = arg.substr(strlen("--remote-debugging-address="));
    } else if (arg == "--fake-exit-immediately") {
      exit_immediately = true;
    } else if (arg == "--fake-never-ready") {
      never_ready = true;
    } else if (arg == "--fake-ignore-sigterm") {
      ignore_sigterm = true;
    } else if (arg == "--fake-keep-alive") {
      g_keep_alive = true;
    } else if (starts_with(arg, "--fake-ready-delay-ms=")) {
      ready_delay_ms = std::atoi(arg.c_str() + strlen("--fake-ready-delay-ms="));
    }
  }

  std::cout << "fake devtools instance pid=" << getpid() << " port=" << port
            << std::endl;

  if (exit_immediately) {
    std::cout << "FATAL: failed to create browser profile (simulated crash)"
              << std::endl;
    return 1;
  }
  if (port <= 0 || port > 65535) {
    std::cout << "ERROR: --remote-debugging-port missing or invalid"
              << std::endl;
    return 2;
  }

  std::signal(SIGTERM, ignore_sigterm ? SIG_IGN : handle_term);
  std::signal(SIGINT, handle_term);

  if (never_ready) {
    while (!g_stop)
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    return 0;
  }

  auto delay_until = std::chrono::steady_clock::now() +
                     std::chrono::milliseconds(ready_delay_ms);
  while (!g_stop && std::chrono::steady_clock::now() < delay_until)
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

  int listen_fd = socket(AF_INET, SOCK_STREAM, 0);
  int opt = 1;
  setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port));
  if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1)
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

  if (bind(listen_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0 ||
      listen(listen_fd, 16) < 0) {
    std::cout << "ERROR: cannot listen on port " << port << ": "
              << std::strerror(errno) << std::endl;
    close(listen_fd);
    return 3;
  }
  std::cout << "DevTools listening on ws://" << address << ":" << port
            << "/devtools/browser/fake" << std::endl;

  while (!g_stop) {
    struct pollfd pfd = {listen_fd, POLLIN, 0};
    int ready = poll(&pfd, 1, 100);
    if (ready <= 0)
      continue;
    int client = accept(listen_fd, nullptr, nullptr);
    if (client < 0)
      continue;
    serve_client(client, port);
    if (!g_keep_alive) {
      close(client);
      continue;
    }
    // Linger until the client hangs up or 5s pass
    std::thread([client] {
      char drain[256];
      struct pollfd cpfd = {client, POLLIN, 0};
      while (poll(&cpfd, 1, 5000) > 0 &&
             recv(client, drain, sizeof(drain), 0) > 0) {
      }
      close(client);
    }).detach();
  }

  close(listen_fd);
  std::cout << "fake devtools instance on port " << port << " exiting"
            << std::endl;
  return 0;
}
