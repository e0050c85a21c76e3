#include "devtools-fleet/server/ProxyEngine.hpp"
#include "devtools-fleet/Logger.hpp"
#include "devtools-fleet/ipc/ProcessHandle.hpp"

namespace dtfleet {

CommandProxyEngine::CommandProxyEngine(const ProxyConfig &config)
    : config_(config) {}

OperationResult CommandProxyEngine::validate() {
  return run(config_.validate_command, FleetError::ValidationFailed,
             "validate");
}

OperationResult CommandProxyEngine::reload() {
  return run(config_.reload_command, FleetError::ReloadFailed, "reload");
}

OperationResult CommandProxyEngine::run(const std::string &command,
                                        FleetError on_failure,
                                        const char *step) {
  LOG_DEBUG("PROXY", "COMMAND", "Running {} command: {}", step, command);
  auto outcome = ipc::run_command(command, config_.command_timeout);

  if (outcome.ok()) {
    return OperationResult::ok(outcome.output);
  }

  std::string reason;
  if (!outcome.spawned) {
    reason = "could not run";
  } else if (outcome.timed_out) {
    reason = fmt::format("timed out after {}ms", config_.command_timeout.count());
  } else {
    reason = fmt::format("exit status {}", outcome.exit_code);
  }

  auto result = OperationResult::failure(
      on_failure, fmt::format("Proxy {} '{}' failed ({}): {}", step, command,
                              reason, outcome.output));
  LOG_WARN("PROXY", "COMMAND", "{}", result.message);
  return result;
}

} // namespace dtfleet
