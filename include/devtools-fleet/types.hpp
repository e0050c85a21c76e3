#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace dtfleet {

using ProcessId = pid_t;

enum class InstanceState { Starting, Ready, Dead };

/// Failure taxonomy shared by every component. TerminationEscalated is a
/// warning: the instance is gone, a forceful kill was needed.
enum class FleetError {
  None,
  Exhausted,
  PortInUse,
  BrowserNotFound,
  SpawnFailed,
  ReadinessTimeout,
  TemplateMissing,
  ValidationFailed,
  ReloadFailed,
  NotFound,
  InvalidArgument,
  TerminationEscalated,
  ConfigError,
};

enum class CheckStatus { Pass, Warn, Fail };

enum class OverallHealth { Healthy, Degraded, Unhealthy };

std::string to_string(InstanceState state);
std::string to_string(FleetError error);
std::string to_string(CheckStatus status);
std::string to_string(OverallHealth health);

InstanceState instance_state_from_string(const std::string &s);

/// Current UTC time as ISO-8601, e.g. "2024-05-01T12:00:00Z".
std::string utc_timestamp();

struct Instance {
  uint16_t port{0};
  ProcessId pid{0};
  std::string data_dir;
  std::string log_path;
  std::string browser;
  std::string started_at; // ISO-8601 UTC
  InstanceState state{InstanceState::Starting};
};

struct RouteRecord {
  uint16_t port{0};
  std::string config_path;
  bool active{false};
};

struct CheckResult {
  std::string name; // "process-alive", "port-reachable", ...
  CheckStatus status{CheckStatus::Pass};
  std::string message;
};

struct PortHealth {
  uint16_t port{0};
  std::vector<CheckResult> checks;
  std::optional<std::string> browser_version;
};

/// Outcome of a fleet operation. Failures carry the error kind and a message
/// naming the port and the step that failed; warnings do not affect success.
struct OperationResult {
  bool success{false};
  FleetError error{FleetError::None};
  std::string message;
  std::vector<std::string> warnings;

  static OperationResult ok(std::string message = {}) {
    OperationResult r;
    r.success = true;
    r.message = std::move(message);
    return r;
  }
  static OperationResult failure(FleetError error, std::string message) {
    OperationResult r;
    r.error = error;
    r.message = std::move(message);
    return r;
  }
};

struct HealthSnapshot {
  std::vector<PortHealth> ports;
  std::vector<CheckResult> fleet_checks;
  OverallHealth overall{OverallHealth::Healthy};
};

} // namespace dtfleet
