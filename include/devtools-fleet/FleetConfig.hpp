#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace dtfleet {

/// Raised for unreadable or malformed configuration. The message names the
/// offending key.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
};

struct PortRange {
  uint16_t start{48000};
  uint16_t end{49000};
};

struct PathsConfig {
  std::string data_root{"/tmp/chrome-debug-data"};
  std::string log_dir{"/var/log/chrome-debug"};
  std::string run_dir{"/var/run/chrome-debug"};
};

struct BrowserConfig {
  std::string binary; // empty: search candidates
  std::vector<std::string> candidates{
      "/usr/bin/google-chrome", "/usr/bin/google-chrome-stable",
      "/usr/bin/chromium", "/usr/bin/chromium-browser",
      "/opt/google/chrome/google-chrome"};
  std::string debugging_address{"0.0.0.0"};
  std::vector<std::string> extra_args;
};

struct SupervisorConfig {
  int readiness_attempts{30};
  std::chrono::milliseconds readiness_interval{1000};
  std::chrono::milliseconds grace_period{10000};
  int log_tail_lines{20};
};

struct ProxyConfig {
  std::string template_path{"/etc/nginx/templates/proxy-template.conf"};
  std::string conf_dir{"/etc/nginx/conf.d"};
  std::string validate_command{"nginx -t"};
  std::string reload_command{"nginx -s reload"};
  std::chrono::milliseconds command_timeout{15000};
  int listen_port_offset{10000};
  std::string upstream_host{"127.0.0.1"};
  std::string route_host{"127.0.0.1"};
  std::string status_command{"systemctl is-active nginx"}; // empty: skip
  std::string error_log{"/var/log/nginx/error.log"};
};

struct HealthConfig {
  std::chrono::milliseconds connect_timeout{2000};
  std::chrono::milliseconds http_timeout{5000};
  std::chrono::milliseconds discovery_timeout{1000};
  int full_scan_span{100};
  int sparse_stride{10};
  std::chrono::milliseconds overall_deadline{30000};
  bool fleet_checks{true};
  double memory_warn_percent{80.0};
  double disk_warn_percent{80.0};
  double disk_fail_percent{90.0};
  int log_error_warn_count{5};
  int proxy_log_error_warn_count{10};
  int max_concurrent_probes{32};
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file; // empty: <log_dir>/devtools-fleet.log
};

struct FleetConfig {
  PortRange ports;
  PathsConfig paths;
  BrowserConfig browser;
  SupervisorConfig supervisor;
  ProxyConfig proxy;
  HealthConfig health;
  LoggingConfig logging;

  /// Parse a YAML document. Missing keys keep their defaults.
  static FleetConfig from_yaml_string(const std::string &yaml);

  /// Load a YAML file. Throws ConfigError if it is missing or malformed.
  static FleetConfig load_file(const std::string &path);

  /// Resolve configuration for the CLI: explicit path, then the
  /// DEVTOOLS_FLEET_CONFIG environment variable, then defaults. Environment
  /// overrides (DEVTOOLS_FLEET_RUN_DIR, DEVTOOLS_FLEET_BROWSER) are applied
  /// last.
  static FleetConfig resolve(const std::string &explicit_path);

  /// Effective manager log file.
  std::string log_file() const;

  /// Throws ConfigError when values are inconsistent.
  void validate() const;

  /// Throws ConfigError unless `port` plus the route listen offset stays
  /// within 1-65535.
  void check_route_port(uint32_t port) const;
};

/// Parse "START-END" into a range. Throws ConfigError on malformed input.
PortRange parse_port_range(const std::string &text);

} // namespace dtfleet
