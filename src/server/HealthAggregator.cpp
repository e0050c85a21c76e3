#include "devtools-fleet/server/HealthAggregator.hpp"
#include "devtools-fleet/Logger.hpp"
#include "devtools-fleet/ipc/ProcessHandle.hpp"
#include "devtools-fleet/net/HttpProbe.hpp"
#include "devtools-fleet/server/InstanceRegistry.hpp"
#include "devtools-fleet/server/ProcessSupervisor.hpp"
#include "devtools-fleet/server/RouteGenerator.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <nlohmann/json.hpp>
#include <regex>
#include <sys/statvfs.h>
#include <thread>

namespace dtfleet {

namespace {

CheckResult make_check(const std::string &name, CheckStatus status,
                       std::string message) {
  return CheckResult{name, status, std::move(message)};
}

std::optional<std::string> browser_from_version(const std::string &body) {
  try {
    auto j = nlohmann::json::parse(body);
    if (j.is_object() && j.contains("Browser") && j["Browser"].is_string())
      return j["Browser"].get<std::string>();
  } catch (const nlohmann::json::exception &ex) {
    LOG_DEBUG("HEALTH", "VERSION", "Unparseable /json/version body: {}",
              ex.what());
  }
  return std::nullopt;
}

CheckResult cancelled_check(uint16_t port, const char *step) {
  return make_check("probe-deadline", CheckStatus::Fail,
                    fmt::format("Port {}: probe cancelled at overall deadline "
                                "before {}",
                                port, step));
}

} // namespace

HealthAggregator::HealthAggregator(const FleetConfig &config,
                                   std::shared_ptr<InstanceRegistry> registry,
                                   std::shared_ptr<ProcessSupervisor> supervisor,
                                   std::shared_ptr<RouteGenerator> routes)
    : config_(config), registry_(std::move(registry)),
      supervisor_(std::move(supervisor)), routes_(std::move(routes)) {}

OverallHealth HealthAggregator::aggregate(const std::vector<CheckResult> &checks) {
  OverallHealth overall = OverallHealth::Healthy;
  for (const auto &check : checks) {
    if (check.status == CheckStatus::Fail)
      return OverallHealth::Unhealthy;
    if (check.status == CheckStatus::Warn)
      overall = OverallHealth::Degraded;
  }
  return overall;
}

OverallHealth HealthAggregator::aggregate(const HealthSnapshot &snapshot) {
  std::vector<CheckResult> all = snapshot.fleet_checks;
  for (const auto &port : snapshot.ports)
    all.insert(all.end(), port.checks.begin(), port.checks.end());
  return aggregate(all);
}

std::set<uint16_t> HealthAggregator::scan_candidates(uint16_t start,
                                                     uint16_t end) const {
  std::set<uint16_t> ports;
  const uint32_t hot_end =
      std::min<uint32_t>(end, uint32_t(start) + config_.health.full_scan_span);

  for (uint32_t p = start; p <= end; ++p) {
    if (p <= hot_end || p % config_.health.sparse_stride == 0)
      ports.insert(static_cast<uint16_t>(p));
  }

  auto in_range = [&](uint16_t p) { return p >= start && p <= end; };
  for (uint16_t p : registry_->ports()) {
    if (in_range(p))
      ports.insert(p);
  }
  for (const auto &route : routes_->list_routes()) {
    if (in_range(route.port))
      ports.insert(route.port);
  }
  return ports;
}

std::set<uint16_t> HealthAggregator::discover(uint16_t start,
                                              uint16_t end) const {
  const std::string host = ProcessSupervisor::probe_host(config_.browser);
  const auto timeout = config_.health.discovery_timeout;

  std::set<uint16_t> found;
  for (uint16_t port : scan_candidates(start, end)) {
    if (!net::tcp_connect(host, port, timeout))
      continue;
    if (net::http_get(host, port, "/json/version", timeout).success()) {
      found.insert(port);
    } else {
      LOG_DEBUG("HEALTH", "DISCOVER",
                "Port {} accepts connections but is not a debugger", port);
    }
  }
  LOG_INFO("HEALTH", "DISCOVER", "Discovered {} instances in {}-{}",
           found.size(), start, end);
  return found;
}

PortHealth HealthAggregator::probe(uint16_t port,
                                   const util::CancellationToken &token) const {
  PortHealth health;
  health.port = port;
  auto &checks = health.checks;
  const std::string host = ProcessSupervisor::probe_host(config_.browser);

  // 1. process-alive
  if (auto instance = registry_->load(port)) {
    if (supervisor_->is_instance_alive(*instance)) {
      checks.push_back(make_check(
          "process-alive", CheckStatus::Pass,
          fmt::format("Port {}: process PID={} is running", port,
                      instance->pid)));
    } else {
      LOG_WARN("HEALTH", "STALE", "Removing stale record for port {}", port);
      supervisor_->discard_stale(port);
      checks.push_back(make_check(
          "process-alive", CheckStatus::Fail,
          fmt::format("Port {}: process PID={} is not running (stale record "
                      "removed)",
                      port, instance->pid)));
      return health;
    }
  } else {
    checks.push_back(make_check(
        "process-alive", CheckStatus::Fail,
        fmt::format("Port {}: no registry record, process not tracked", port)));
    return health;
  }

  // 2. port-reachable
  if (token.is_cancelled()) {
    checks.push_back(cancelled_check(port, "port-reachable"));
    return health;
  }
  if (!net::tcp_connect(host, port, config_.health.connect_timeout)) {
    checks.push_back(make_check(
        "port-reachable", CheckStatus::Fail,
        fmt::format("Port {}: debugger port not accepting connections", port)));
    return health;
  }
  checks.push_back(make_check(
      "port-reachable", CheckStatus::Pass,
      fmt::format("Port {}: accepting connections", port)));

  // 3. protocol-endpoints-ok
  for (const char *endpoint : {"/json/version", "/json/list"}) {
    if (token.is_cancelled()) {
      checks.push_back(cancelled_check(port, endpoint));
      return health;
    }
    auto response =
        net::http_get(host, port, endpoint, config_.health.http_timeout);
    if (!response.success()) {
      checks.push_back(make_check(
          "protocol-endpoints-ok", CheckStatus::Fail,
          fmt::format("Port {}: endpoint {} failed ({})", port, endpoint,
                      response.transport_ok
                          ? "HTTP " + std::to_string(response.status)
                          : response.error)));
      return health;
    }
    if (std::string(endpoint) == "/json/version")
      health.browser_version = browser_from_version(response.body);
  }
  checks.push_back(make_check(
      "protocol-endpoints-ok", CheckStatus::Pass,
      fmt::format("Port {}: /json/version and /json/list respond", port)));

  // 4. proxy-route-ok
  if (!routes_->has_route(port)) {
    checks.push_back(make_check(
        "proxy-route-ok", CheckStatus::Warn,
        fmt::format("Port {}: no proxy route file {}", port,
                    routes_->route_path(port))));
    return health;
  }

  const std::string &route_host = config_.proxy.route_host;
  const uint32_t listen_port = routes_->proxy_port(port);
  if (listen_port > 65535) {
    checks.push_back(make_check(
        "proxy-route-ok", CheckStatus::Fail,
        fmt::format("Port {}: route listen port {} is outside 1-65535", port,
                    listen_port)));
    return health;
  }
  const uint16_t route_port = static_cast<uint16_t>(listen_port);
  for (const char *endpoint : {"/json/version", "/json/list"}) {
    if (token.is_cancelled()) {
      checks.push_back(cancelled_check(port, "proxy-route-ok"));
      return health;
    }
    auto response = net::http_get(route_host, route_port, endpoint,
                                  config_.health.http_timeout);
    if (!response.success()) {
      checks.push_back(make_check(
          "proxy-route-ok", CheckStatus::Fail,
          fmt::format("Port {}: {} through route {}:{} failed ({})", port,
                      endpoint, route_host, route_port,
                      response.transport_ok
                          ? "HTTP " + std::to_string(response.status)
                          : response.error)));
      return health;
    }
  }

  auto aux = net::http_get(route_host, route_port, "/health",
                           config_.health.http_timeout);
  if (!aux.success()) {
    checks.push_back(make_check(
        "proxy-route-ok", CheckStatus::Warn,
        fmt::format("Port {}: route {}:{} works, optional /health endpoint "
                    "unavailable",
                    port, route_host, route_port)));
    return health;
  }
  checks.push_back(make_check(
      "proxy-route-ok", CheckStatus::Pass,
      fmt::format("Port {}: route {}:{} serves all endpoints", port,
                  route_host, route_port)));
  return health;
}

std::vector<PortHealth>
HealthAggregator::probe_all(const std::set<uint16_t> &ports) const {
  util::CancellationToken token;
  const auto deadline =
      std::chrono::steady_clock::now() + config_.health.overall_deadline;

  auto report_late = [&](uint16_t port) {
    token.cancel();
    PortHealth late;
    late.port = port;
    late.checks.push_back(make_check(
        "probe-deadline", CheckStatus::Fail,
        fmt::format("Port {}: probe did not finish within {}ms", port,
                    config_.health.overall_deadline.count())));
    LOG_WARN("HEALTH", "DEADLINE", "{}", late.checks.back().message);
    return late;
  };

  // At most max_concurrent_probes threads at a time
  const size_t batch_size =
      static_cast<size_t>(std::max(1, config_.health.max_concurrent_probes));
  const std::vector<uint16_t> order(ports.begin(), ports.end());

  std::vector<PortHealth> results;
  results.reserve(order.size());
  for (size_t first = 0; first < order.size(); first += batch_size) {
    const size_t last = std::min(order.size(), first + batch_size);
    if (token.is_cancelled() || std::chrono::steady_clock::now() >= deadline) {
      for (size_t i = first; i < last; ++i)
        results.push_back(report_late(order[i]));
      continue;
    }

    std::vector<std::future<PortHealth>> pending;
    for (size_t i = first; i < last; ++i) {
      uint16_t port = order[i];
      pending.push_back(std::async(std::launch::async, [this, port, token] {
        return probe(port, token);
      }));
    }
    for (size_t i = 0; i < pending.size(); ++i) {
      if (pending[i].wait_until(deadline) == std::future_status::ready) {
        results.push_back(pending[i].get());
      } else {
        results.push_back(report_late(order[first + i]));
      }
    }
    // Cancelled probes stop at their next step; the batch joins here
  }
  return results;
}

CheckResult HealthAggregator::check_memory() const {
  std::ifstream in("/proc/meminfo");
  if (!in) {
    return make_check("memory-usage", CheckStatus::Pass,
                      "Memory usage unavailable");
  }

  double total = 0, available = 0;
  std::string key;
  double value = 0;
  std::string unit;
  while (in >> key >> value) {
    std::getline(in, unit);
    if (key == "MemTotal:")
      total = value;
    else if (key == "MemAvailable:")
      available = value;
  }
  if (total <= 0) {
    return make_check("memory-usage", CheckStatus::Pass,
                      "Memory usage unavailable");
  }

  double used = (total - available) * 100.0 / total;
  if (used > config_.health.memory_warn_percent) {
    return make_check("memory-usage", CheckStatus::Warn,
                      fmt::format("High memory usage: {:.1f}%", used));
  }
  return make_check("memory-usage", CheckStatus::Pass,
                    fmt::format("Memory usage is acceptable: {:.1f}%", used));
}

CheckResult HealthAggregator::check_disk() const {
  struct statvfs fs_stats;
  std::string path = config_.paths.data_root;
  if (statvfs(path.c_str(), &fs_stats) != 0) {
    path = "/";
    if (statvfs(path.c_str(), &fs_stats) != 0) {
      return make_check("disk-usage", CheckStatus::Pass,
                        "Disk usage unavailable");
    }
  }

  double used_blocks =
      static_cast<double>(fs_stats.f_blocks) - fs_stats.f_bfree;
  double usable = used_blocks + fs_stats.f_bavail;
  if (usable <= 0) {
    return make_check("disk-usage", CheckStatus::Pass, "Disk usage unavailable");
  }

  double used = used_blocks * 100.0 / usable;
  if (used > config_.health.disk_fail_percent) {
    return make_check("disk-usage", CheckStatus::Fail,
                      fmt::format("Critical disk usage on {}: {:.0f}%", path,
                                  used));
  }
  if (used > config_.health.disk_warn_percent) {
    return make_check("disk-usage", CheckStatus::Warn,
                      fmt::format("High disk usage on {}: {:.0f}%", path, used));
  }
  return make_check("disk-usage", CheckStatus::Pass,
                    fmt::format("Disk usage on {} is acceptable: {:.0f}%", path,
                                used));
}

CheckResult HealthAggregator::check_load() const {
  std::ifstream in("/proc/loadavg");
  double load = 0;
  unsigned cores = std::thread::hardware_concurrency();
  if (!in || !(in >> load) || cores == 0) {
    return make_check("system-load", CheckStatus::Pass,
                      "System load unavailable");
  }

  if (load > 2.0 * cores) {
    return make_check("system-load", CheckStatus::Warn,
                      fmt::format("High system load: {:.2f} on {} cores", load,
                                  cores));
  }
  return make_check("system-load", CheckStatus::Pass,
                    fmt::format("System load is acceptable: {:.2f} on {} cores",
                                load, cores));
}

CheckResult HealthAggregator::check_instance_logs() const {
  static const std::regex ERROR_LINE("error|failed|crash", std::regex::icase);

  int errors = 0;
  for (const auto &instance : registry_->load_all()) {
    for (const auto &line : ProcessSupervisor::tail_lines(instance.log_path, 20)) {
      if (std::regex_search(line, ERROR_LINE))
        ++errors;
    }
  }

  if (errors > config_.health.log_error_warn_count) {
    return make_check("instance-log-errors", CheckStatus::Warn,
                      fmt::format("{} error lines in recent instance logs",
                                  errors));
  }
  return make_check("instance-log-errors", CheckStatus::Pass,
                    fmt::format("{} error lines in recent instance logs",
                                errors));
}

CheckResult HealthAggregator::check_proxy_service() const {
  const std::string &command = config_.proxy.status_command;
  auto status = ipc::run_command(command, config_.proxy.command_timeout);
  if (status.ok()) {
    return make_check("proxy-service", CheckStatus::Pass,
                      "Proxy service is running");
  }
  std::string detail = status.output;
  while (!detail.empty() && (detail.back() == '\n' || detail.back() == ' '))
    detail.pop_back();
  return make_check(
      "proxy-service", CheckStatus::Fail,
      fmt::format("Proxy service is not running ('{}' {}{})", command,
                  status.timed_out ? "timed out"
                                   : "exited " + std::to_string(status.exit_code),
                  detail.empty() ? "" : ": " + detail));
}

CheckResult HealthAggregator::check_proxy_log() const {
  static const std::regex ERROR_LINE("error", std::regex::icase);

  const std::string &path = config_.proxy.error_log;
  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) {
    return make_check("proxy-log-errors", CheckStatus::Pass,
                      "Proxy error log unavailable");
  }

  int errors = 0;
  for (const auto &line : ProcessSupervisor::tail_lines(path, 50)) {
    if (std::regex_search(line, ERROR_LINE))
      ++errors;
  }
  if (errors > config_.health.proxy_log_error_warn_count) {
    return make_check("proxy-log-errors", CheckStatus::Warn,
                      fmt::format("{} recent errors in {}", errors, path));
  }
  return make_check("proxy-log-errors", CheckStatus::Pass,
                    fmt::format("{} recent errors in {}", errors, path));
}

std::vector<CheckResult>
HealthAggregator::fleet_checks(size_t discovered_count) const {
  std::vector<CheckResult> checks;

  if (discovered_count == 0) {
    checks.push_back(make_check("instances-discovered", CheckStatus::Warn,
                                "No active debugger instances found"));
  } else {
    checks.push_back(make_check(
        "instances-discovered", CheckStatus::Pass,
        fmt::format("{} active debugger instances", discovered_count)));
  }

  if (!config_.health.fleet_checks)
    return checks;

  if (!config_.proxy.status_command.empty())
    checks.push_back(check_proxy_service());

  auto validation = routes_->validate_current();
  checks.push_back(make_check(
      "proxy-config-valid",
      validation.success ? CheckStatus::Pass : CheckStatus::Fail,
      validation.success ? "Proxy configuration is valid"
                         : "Proxy configuration has errors: " +
                               validation.message));

  checks.push_back(check_memory());
  checks.push_back(check_disk());
  checks.push_back(check_load());
  checks.push_back(check_proxy_log());
  checks.push_back(check_instance_logs());
  return checks;
}

HealthSnapshot HealthAggregator::check_port(uint16_t port) const {
  HealthSnapshot snapshot;
  snapshot.ports.push_back(probe(port));
  snapshot.overall = aggregate(snapshot);
  return snapshot;
}

HealthSnapshot HealthAggregator::check_fleet(uint16_t start,
                                             uint16_t end) const {
  HealthSnapshot snapshot;

  auto ports = discover(start, end);
  const size_t discovered = ports.size();
  for (uint16_t tracked : registry_->ports())
    ports.insert(tracked);

  snapshot.ports = probe_all(ports);
  snapshot.fleet_checks = fleet_checks(discovered);
  snapshot.overall = aggregate(snapshot);

  LOG_INFO("HEALTH", "FLEET", "Overall {} across {} ports",
           to_string(snapshot.overall), snapshot.ports.size());
  return snapshot;
}

} // namespace dtfleet
