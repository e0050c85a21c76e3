#include "devtools-fleet/types.hpp"
#include <ctime>

namespace dtfleet {

std::string to_string(InstanceState state) {
  switch (state) {
  case InstanceState::Starting:
    return "STARTING";
  case InstanceState::Ready:
    return "READY";
  case InstanceState::Dead:
    return "DEAD";
  }
  return "UNKNOWN";
}

std::string to_string(FleetError error) {
  switch (error) {
  case FleetError::None:
    return "none";
  case FleetError::Exhausted:
    return "exhausted";
  case FleetError::PortInUse:
    return "port_in_use";
  case FleetError::BrowserNotFound:
    return "browser_not_found";
  case FleetError::SpawnFailed:
    return "spawn_failed";
  case FleetError::ReadinessTimeout:
    return "readiness_timeout";
  case FleetError::TemplateMissing:
    return "template_missing";
  case FleetError::ValidationFailed:
    return "validation_failed";
  case FleetError::ReloadFailed:
    return "reload_failed";
  case FleetError::NotFound:
    return "not_found";
  case FleetError::InvalidArgument:
    return "invalid_argument";
  case FleetError::TerminationEscalated:
    return "termination_escalated";
  case FleetError::ConfigError:
    return "config_error";
  }
  return "unknown";
}

std::string to_string(CheckStatus status) {
  switch (status) {
  case CheckStatus::Pass:
    return "pass";
  case CheckStatus::Warn:
    return "warn";
  case CheckStatus::Fail:
    return "fail";
  }
  return "fail";
}

std::string to_string(OverallHealth health) {
  switch (health) {
  case OverallHealth::Healthy:
    return "healthy";
  case OverallHealth::Degraded:
    return "degraded";
  case OverallHealth::Unhealthy:
    return "unhealthy";
  }
  return "unhealthy";
}

InstanceState instance_state_from_string(const std::string &s) {
  if (s == "READY")
    return InstanceState::Ready;
  if (s == "DEAD")
    return InstanceState::Dead;
  return InstanceState::Starting;
}

std::string utc_timestamp() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

} // namespace dtfleet
