#include "devtools-fleet/server/CommandHandlers.hpp"
#include "devtools-fleet/FleetConfig.hpp"
#include "devtools-fleet/Logger.hpp"
#include "devtools-fleet/server/FleetManager.hpp"
#include "devtools-fleet/server/InstanceRegistry.hpp"
#include "devtools-fleet/server/RouteGenerator.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace dtfleet {
namespace server {

/*
  Handlers build a FleetManager from the resolved configuration, run one
  operation and describe the outcome in `out`. Failures carry "error" (the
  error kind) and "message" (which port and step failed).
*/

namespace {

void fail(json &out, FleetError error, const std::string &message) {
  out["ok"] = false;
  out["error"] = to_string(error);
  out["message"] = message;
}

int describe(const OperationResult &result, json &out) {
  out["ok"] = result.success;
  if (!result.success) {
    out["error"] = to_string(result.error);
  }
  out["message"] = result.message;
  if (!result.warnings.empty()) {
    out["warnings"] = result.warnings;
  }
  return result.success ? 0 : 1;
}

json checks_to_json(const std::vector<CheckResult> &checks) {
  json arr = json::array();
  for (const auto &check : checks) {
    arr.push_back({{"name", check.name},
                   {"status", to_string(check.status)},
                   {"message", check.message}});
  }
  return arr;
}

// Reads a port from params[key]; fills `out` and returns nullopt on error.
std::optional<uint16_t> port_param(const json &params, const char *key,
                                   json &out) {
  if (!params.contains(key) || params[key].is_null()) {
    fail(out, FleetError::InvalidArgument,
         std::string("missing ") + key);
    return std::nullopt;
  }
  int port = 0;
  const auto &value = params[key];
  if (value.is_number_integer()) {
    port = value.get<int>();
  } else if (value.is_string()) {
    try {
      size_t consumed = 0;
      std::string text = value.get<std::string>();
      port = std::stoi(text, &consumed);
      if (consumed != text.size())
        port = 0;
    } catch (const std::logic_error &) {
      port = 0;
    }
  }
  if (port < 1 || port > 65535) {
    fail(out, FleetError::InvalidArgument,
         "invalid port: " + value.dump());
    return std::nullopt;
  }
  return static_cast<uint16_t>(port);
}

// Configuration, logger and manager for one command.
std::unique_ptr<FleetManager> make_manager(const json &params, json &out) {
  try {
    FleetConfig config = FleetConfig::resolve(params.value("config_path", ""));
    config.logging.level = params.value("log_level", config.logging.level);
    config.validate();
    FleetLogger::instance().init(config.log_file(),
                                 spdlog::level::from_str(config.logging.level));
    return std::make_unique<FleetManager>(std::move(config));
  } catch (const ConfigError &ex) {
    fail(out, FleetError::ConfigError, ex.what());
    return nullptr;
  }
}

// Optional "range" param; fills `out` and returns false on error.
bool range_param(const json &params, std::optional<PortRange> &range,
                 json &out) {
  std::string text = params.value("range", "");
  if (text.empty())
    return true;
  try {
    range = parse_port_range(text);
    return true;
  } catch (const ConfigError &ex) {
    fail(out, FleetError::InvalidArgument, ex.what());
    return false;
  }
}

} // namespace

int handle_start(const json &params, json &out) {
  out = json::object();

  std::optional<uint16_t> port;
  if (params.contains("port") && !params["port"].is_null()) {
    port = port_param(params, "port", out);
    if (!port)
      return 1;
  }
  std::optional<PortRange> range;
  if (!range_param(params, range, out))
    return 1;
  std::vector<std::string> extra_args =
      params.value("extra_args", std::vector<std::string>{});

  auto manager = make_manager(params, out);
  if (!manager)
    return 1;

  auto result = manager->start(port, extra_args, range);
  int rc = describe(result.status, out);
  if (result.instance) {
    out["port"] = result.instance->port;
    out["pid"] = result.instance->pid;
    out["state"] = to_string(result.instance->state);
    out["route"] = result.route_path;
  }
  if (!result.log_tail.empty()) {
    out["log_tail"] = result.log_tail;
  }
  return rc;
}

int handle_stop(const json &params, json &out) {
  out = json::object();
  auto port = port_param(params, "port", out);
  if (!port)
    return 1;

  auto manager = make_manager(params, out);
  if (!manager)
    return 1;

  int rc = describe(manager->stop(*port), out);
  out["port"] = *port;
  return rc;
}

int handle_stop_all(const json &params, json &out) {
  out = json::object();
  auto manager = make_manager(params, out);
  if (!manager)
    return 1;
  return describe(manager->stop_all(), out);
}

int handle_list(const json &params, json &out) {
  out = json::object();
  auto manager = make_manager(params, out);
  if (!manager)
    return 1;

  json instances = json::array();
  for (const auto &instance : manager->list()) {
    instances.push_back(instance_to_json(instance));
  }
  out["ok"] = true;
  out["instances"] = instances;
  return 0;
}

int handle_health(const json &params, json &out) {
  out = json::object();

  std::optional<uint16_t> port;
  if (params.contains("port") && !params["port"].is_null()) {
    port = port_param(params, "port", out);
    if (!port)
      return 2;
  }
  std::optional<PortRange> range;
  if (!range_param(params, range, out))
    return 2;

  auto manager = make_manager(params, out);
  if (!manager)
    return 2;

  auto snapshot = manager->health(port, range);

  json ports = json::array();
  for (const auto &ph : snapshot.ports) {
    json entry = {{"port", ph.port}, {"checks", checks_to_json(ph.checks)}};
    if (ph.browser_version) {
      entry["browser"] = *ph.browser_version;
    }
    ports.push_back(entry);
  }

  out["ok"] = snapshot.overall != OverallHealth::Unhealthy;
  out["overall"] = to_string(snapshot.overall);
  out["ports"] = ports;
  out["fleet_checks"] = checks_to_json(snapshot.fleet_checks);

  switch (snapshot.overall) {
  case OverallHealth::Healthy:
    return 0;
  case OverallHealth::Degraded:
    return 1;
  case OverallHealth::Unhealthy:
    return 2;
  }
  return 2;
}

int handle_generate_config(const json &params, json &out) {
  out = json::object();
  auto port = port_param(params, "port", out);
  if (!port)
    return 1;

  auto manager = make_manager(params, out);
  if (!manager)
    return 1;

  int rc = describe(manager->generate_config(*port), out);
  out["port"] = *port;
  if (rc == 0) {
    out["route"] = manager->routes().route_path(*port);
  }
  return rc;
}

} // namespace server
} // namespace dtfleet
