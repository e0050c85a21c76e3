#include "devtools-fleet/server/FleetManager.hpp"
#include "devtools-fleet/Logger.hpp"
#include "devtools-fleet/server/HealthAggregator.hpp"
#include "devtools-fleet/server/InstanceRegistry.hpp"
#include "devtools-fleet/server/PortAllocator.hpp"
#include "devtools-fleet/server/ProcessSupervisor.hpp"
#include "devtools-fleet/server/ProxyEngine.hpp"
#include "devtools-fleet/server/RouteGenerator.hpp"

#include <filesystem>

namespace dtfleet {

FleetManager::FleetManager(FleetConfig config,
                           std::shared_ptr<ProxyEngine> engine)
    : config_(std::move(config)) {
  std::error_code ec;
  std::filesystem::create_directories(config_.paths.run_dir, ec);
  if (ec) {
    LOG_WARN("FLEET", "INIT", "Cannot create run dir {}: {}",
             config_.paths.run_dir, ec.message());
  }

  registry_ = std::make_shared<InstanceRegistry>(config_.paths.run_dir);
  engine_ = engine ? std::move(engine)
                   : std::make_shared<CommandProxyEngine>(config_.proxy);
  allocator_ =
      std::make_shared<PortAllocator>(config_.paths.run_dir, registry_);
  supervisor_ = std::make_shared<ProcessSupervisor>(config_, registry_);
  routes_ = std::make_shared<RouteGenerator>(config_, engine_);
  health_ = std::make_shared<HealthAggregator>(config_, registry_,
                                               supervisor_, routes_);
}

FleetManager::~FleetManager() = default;

void FleetManager::reconcile() {
  auto removed = supervisor_->reconcile();
  if (!removed.empty()) {
    LOG_INFO("FLEET", "RECONCILE", "Removed {} stale registry entries",
             removed.size());
  }
}

StartResult FleetManager::start(std::optional<uint16_t> port,
                                const std::vector<std::string> &extra_args,
                                std::optional<PortRange> range) {
  StartResult result;

  // Reject ports whose route would land outside 1-65535 before claiming
  try {
    if (port)
      config_.check_route_port(*port);
    if (range)
      config_.check_route_port(range->end);
  } catch (const ConfigError &ex) {
    result.status =
        OperationResult::failure(FleetError::InvalidArgument, ex.what());
    LOG_ERROR("FLEET", "START", "{}", result.status.message);
    return result;
  }

  reconcile();

  std::string browser_error;
  if (!ProcessSupervisor::find_browser(config_.browser, &browser_error)) {
    result.status =
        OperationResult::failure(FleetError::BrowserNotFound, browser_error);
    LOG_ERROR("FLEET", "START", "{}", browser_error);
    return result;
  }

  PortRange scan = range.value_or(config_.ports);
  ClaimResult claim = port ? allocator_->claim(*port)
                           : allocator_->allocate_and_claim(scan.start,
                                                            scan.end);
  if (!claim.status.success) {
    result.status = claim.status;
    return result;
  }
  const uint16_t chosen = claim.claim->port();

  auto spawned = supervisor_->spawn(chosen, extra_args);
  if (!spawned.status.success) {
    // Claim released by its destructor
    result.status = spawned.status;
    result.log_tail = spawned.log_tail;
    return result;
  }
  claim.claim->release();
  result.instance = spawned.instance;
  result.status = spawned.status;

  auto activation = routes_->activate(chosen);
  if (!activation.success) {
    LOG_ERROR("FLEET", "START",
              "Route activation failed for port {}, stopping instance",
              chosen);
    auto stopped = supervisor_->terminate(chosen);
    if (!stopped.success) {
      activation.warnings.push_back(stopped.message);
    }
    result.instance.reset();
    result.status = activation;
    return result;
  }

  result.route_path = routes_->route_path(chosen);
  result.status.message = fmt::format("Instance ready on port {}", chosen);
  LOG_INFO("FLEET", "START", "{}", result.status.message);
  return result;
}

OperationResult FleetManager::stop(uint16_t port) {
  reconcile();

  auto terminated = supervisor_->terminate(port);
  auto deactivated = routes_->deactivate(port);

  OperationResult result = terminated;
  result.warnings.insert(result.warnings.end(), deactivated.warnings.begin(),
                         deactivated.warnings.end());
  if (!deactivated.success) {
    if (result.success) {
      result.success = false;
      result.error = deactivated.error;
      result.message = deactivated.message;
    } else {
      result.warnings.push_back(deactivated.message);
    }
  }
  if (result.success) {
    result.message = fmt::format("Stopped port {}", port);
  }
  return result;
}

OperationResult FleetManager::stop_all() {
  auto terminated = supervisor_->terminate_all();
  auto deactivated = routes_->deactivate_all();

  OperationResult result = terminated;
  if (!deactivated.success) {
    if (result.success) {
      result.success = false;
      result.error = deactivated.error;
      result.message = deactivated.message;
    } else {
      result.warnings.push_back(deactivated.message);
    }
  }
  if (result.success) {
    result.message = terminated.message + "; " + deactivated.message;
  }
  return result;
}

std::vector<Instance> FleetManager::list() {
  reconcile();
  return registry_->load_all();
}

HealthSnapshot FleetManager::health(std::optional<uint16_t> port,
                                    std::optional<PortRange> range) {
  reconcile();
  if (port) {
    return health_->check_port(*port);
  }
  PortRange scan = range.value_or(config_.ports);
  return health_->check_fleet(scan.start, scan.end);
}

OperationResult FleetManager::generate_config(uint16_t port) {
  return routes_->activate(port);
}

} // namespace dtfleet
