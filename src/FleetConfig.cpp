#include "devtools-fleet/FleetConfig.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

namespace dtfleet {

namespace {

template <typename T>
void read_value(const YAML::Node &section, const std::string &section_name,
                const std::string &key, T &out) {
  const YAML::Node node = section[key];
  if (!node.IsDefined() || node.IsNull())
    return;
  try {
    out = node.as<T>();
  } catch (const YAML::Exception &ex) {
    throw ConfigError("Invalid value for '" + section_name + "." + key +
                      "': " + ex.what());
  }
}

void read_ms(const YAML::Node &section, const std::string &section_name,
             const std::string &key, std::chrono::milliseconds &out) {
  int64_t ms = out.count();
  read_value(section, section_name, key, ms);
  if (ms < 0) {
    throw ConfigError("Negative duration for '" + section_name + "." + key +
                      "'");
  }
  out = std::chrono::milliseconds(ms);
}

void read_port(const YAML::Node &section, const std::string &section_name,
               const std::string &key, uint16_t &out) {
  int value = out;
  read_value(section, section_name, key, value);
  if (value < 1 || value > 65535) {
    throw ConfigError("Port out of range for '" + section_name + "." + key +
                      "': " + std::to_string(value));
  }
  out = static_cast<uint16_t>(value);
}

FleetConfig config_from_node(const YAML::Node &root) {
  FleetConfig cfg;

  if (!root || root.IsNull())
    return cfg;
  if (!root.IsMap())
    throw ConfigError("Configuration root must be a mapping");

  if (const YAML::Node ports = root["ports"]) {
    read_port(ports, "ports", "start", cfg.ports.start);
    read_port(ports, "ports", "end", cfg.ports.end);
  }

  if (const YAML::Node paths = root["paths"]) {
    read_value(paths, "paths", "data_root", cfg.paths.data_root);
    read_value(paths, "paths", "log_dir", cfg.paths.log_dir);
    read_value(paths, "paths", "run_dir", cfg.paths.run_dir);
  }

  if (const YAML::Node browser = root["browser"]) {
    read_value(browser, "browser", "binary", cfg.browser.binary);
    read_value(browser, "browser", "candidates", cfg.browser.candidates);
    read_value(browser, "browser", "debugging_address",
               cfg.browser.debugging_address);
    read_value(browser, "browser", "extra_args", cfg.browser.extra_args);
  }

  if (const YAML::Node sup = root["supervisor"]) {
    read_value(sup, "supervisor", "readiness_attempts",
               cfg.supervisor.readiness_attempts);
    read_ms(sup, "supervisor", "readiness_interval_ms",
            cfg.supervisor.readiness_interval);
    read_ms(sup, "supervisor", "grace_period_ms", cfg.supervisor.grace_period);
    read_value(sup, "supervisor", "log_tail_lines",
               cfg.supervisor.log_tail_lines);
  }

  if (const YAML::Node proxy = root["proxy"]) {
    read_value(proxy, "proxy", "template", cfg.proxy.template_path);
    read_value(proxy, "proxy", "conf_dir", cfg.proxy.conf_dir);
    read_value(proxy, "proxy", "validate_command", cfg.proxy.validate_command);
    read_value(proxy, "proxy", "reload_command", cfg.proxy.reload_command);
    read_ms(proxy, "proxy", "command_timeout_ms", cfg.proxy.command_timeout);
    read_value(proxy, "proxy", "listen_port_offset",
               cfg.proxy.listen_port_offset);
    read_value(proxy, "proxy", "upstream_host", cfg.proxy.upstream_host);
    read_value(proxy, "proxy", "route_host", cfg.proxy.route_host);
    read_value(proxy, "proxy", "status_command", cfg.proxy.status_command);
    read_value(proxy, "proxy", "error_log", cfg.proxy.error_log);
  }

  if (const YAML::Node health = root["health"]) {
    read_ms(health, "health", "connect_timeout_ms",
            cfg.health.connect_timeout);
    read_ms(health, "health", "http_timeout_ms", cfg.health.http_timeout);
    read_ms(health, "health", "discovery_timeout_ms",
            cfg.health.discovery_timeout);
    read_value(health, "health", "full_scan_span", cfg.health.full_scan_span);
    read_value(health, "health", "sparse_stride", cfg.health.sparse_stride);
    read_ms(health, "health", "overall_deadline_ms",
            cfg.health.overall_deadline);
    read_value(health, "health", "fleet_checks", cfg.health.fleet_checks);
    read_value(health, "health", "memory_warn_percent",
               cfg.health.memory_warn_percent);
    read_value(health, "health", "disk_warn_percent",
               cfg.health.disk_warn_percent);
    read_value(health, "health", "disk_fail_percent",
               cfg.health.disk_fail_percent);
    read_value(health, "health", "log_error_warn_count",
               cfg.health.log_error_warn_count);
    read_value(health, "health", "proxy_log_error_warn_count",
               cfg.health.proxy_log_error_warn_count);
    read_value(health, "health", "max_concurrent_probes",
               cfg.health.max_concurrent_probes);
  }

  if (const YAML::Node logging = root["logging"]) {
    read_value(logging, "logging", "level", cfg.logging.level);
    read_value(logging, "logging", "file", cfg.logging.file);
  }

  cfg.validate();
  return cfg;
}

} // namespace

FleetConfig FleetConfig::from_yaml_string(const std::string &yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception &ex) {
    throw ConfigError(std::string("Malformed configuration: ") + ex.what());
  }
  return config_from_node(root);
}

FleetConfig FleetConfig::load_file(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    throw ConfigError("Configuration file not found: " + path);
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception &ex) {
    throw ConfigError("Failed to load " + path + ": " + ex.what());
  }
  return config_from_node(root);
}

FleetConfig FleetConfig::resolve(const std::string &explicit_path) {
  FleetConfig cfg;

  if (!explicit_path.empty()) {
    cfg = load_file(explicit_path);
  } else if (const char *env_path = std::getenv("DEVTOOLS_FLEET_CONFIG");
             env_path && env_path[0]) {
    cfg = load_file(env_path);
  }

  if (const char *run_dir = std::getenv("DEVTOOLS_FLEET_RUN_DIR");
      run_dir && run_dir[0]) {
    cfg.paths.run_dir = run_dir;
  }
  if (const char *browser = std::getenv("DEVTOOLS_FLEET_BROWSER");
      browser && browser[0]) {
    cfg.browser.binary = browser;
  }

  return cfg;
}

std::string FleetConfig::log_file() const {
  if (!logging.file.empty())
    return logging.file;
  return (std::filesystem::path(paths.log_dir) / "devtools-fleet.log")
      .string();
}

void FleetConfig::validate() const {
  if (ports.start > ports.end) {
    throw ConfigError("ports.start (" + std::to_string(ports.start) +
                      ") is greater than ports.end (" +
                      std::to_string(ports.end) + ")");
  }
  if (supervisor.readiness_attempts < 1)
    throw ConfigError("supervisor.readiness_attempts must be at least 1");
  if (supervisor.readiness_interval.count() == 0)
    throw ConfigError("supervisor.readiness_interval_ms must be positive");
  if (health.sparse_stride < 1)
    throw ConfigError("health.sparse_stride must be at least 1");
  if (health.full_scan_span < 0)
    throw ConfigError("health.full_scan_span must not be negative");
  if (proxy.listen_port_offset < 0)
    throw ConfigError("proxy.listen_port_offset must not be negative");
  check_route_port(ports.end);
  if (health.max_concurrent_probes < 1)
    throw ConfigError("health.max_concurrent_probes must be at least 1");
  if (health.disk_warn_percent > health.disk_fail_percent)
    throw ConfigError(
        "health.disk_warn_percent is greater than health.disk_fail_percent");
  if (spdlog::level::from_str(logging.level) == spdlog::level::off &&
      logging.level != "off") {
    throw ConfigError("logging.level is not a log level: " + logging.level);
  }
  if (paths.data_root.empty() || paths.run_dir.empty())
    throw ConfigError("paths.data_root and paths.run_dir must be set");
}

void FleetConfig::check_route_port(uint32_t port) const {
  const uint32_t route_port =
      port + static_cast<uint32_t>(std::max(0, proxy.listen_port_offset));
  if (route_port > 65535) {
    throw ConfigError("Port " + std::to_string(port) +
                      " with proxy.listen_port_offset " +
                      std::to_string(proxy.listen_port_offset) +
                      " puts its route on " + std::to_string(route_port) +
                      ", outside 1-65535");
  }
}

PortRange parse_port_range(const std::string &text) {
  auto dash = text.find('-');
  if (dash == std::string::npos || dash == 0 || dash + 1 >= text.size()) {
    throw ConfigError("Port range must look like START-END: " + text);
  }

  PortRange range;
  try {
    size_t consumed = 0;
    int start = std::stoi(text.substr(0, dash), &consumed);
    if (consumed != dash)
      throw ConfigError("Invalid range start: " + text);
    std::string end_text = text.substr(dash + 1);
    int end = std::stoi(end_text, &consumed);
    if (consumed != end_text.size())
      throw ConfigError("Invalid range end: " + text);
    if (start < 1 || end > 65535 || start > end)
      throw ConfigError("Port range out of bounds: " + text);
    range.start = static_cast<uint16_t>(start);
    range.end = static_cast<uint16_t>(end);
  } catch (const std::logic_error &) {
    throw ConfigError("Port range must be numeric: " + text);
  }
  return range;
}

} // namespace dtfleet
