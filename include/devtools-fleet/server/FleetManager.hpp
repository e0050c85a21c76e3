#pragma once
#include "devtools-fleet/FleetConfig.hpp"
#include "devtools-fleet/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dtfleet {

class InstanceRegistry;
class PortAllocator;
class ProcessSupervisor;
class ProxyEngine;
class RouteGenerator;
class HealthAggregator;

struct StartResult {
  OperationResult status;
  std::optional<Instance> instance;
  std::string route_path;
  std::string log_tail;
};

/// Entry point for every fleet command. Owns the configuration and wires
/// the allocator, supervisor, route generator and health aggregator to it.
class FleetManager {
public:
  /// A null engine selects the command-driven proxy engine from config.
  explicit FleetManager(FleetConfig config,
                        std::shared_ptr<ProxyEngine> engine = nullptr);
  ~FleetManager();

  FleetManager(const FleetManager &) = delete;
  FleetManager &operator=(const FleetManager &) = delete;

  const FleetConfig &config() const { return config_; }

  /// Claim (or allocate) a port, spawn an instance and activate its route.
  /// All-or-nothing: a failed route activation stops the new instance.
  StartResult start(std::optional<uint16_t> port,
                    const std::vector<std::string> &extra_args = {},
                    std::optional<PortRange> range = std::nullopt);

  OperationResult stop(uint16_t port);
  OperationResult stop_all();

  /// Tracked instances after reconciliation, ordered by port.
  std::vector<Instance> list();

  /// One port when given, otherwise the whole fleet within `range`.
  HealthSnapshot health(std::optional<uint16_t> port,
                        std::optional<PortRange> range = std::nullopt);

  /// Route activation on its own.
  OperationResult generate_config(uint16_t port);

  InstanceRegistry &registry() { return *registry_; }
  PortAllocator &allocator() { return *allocator_; }
  ProcessSupervisor &supervisor() { return *supervisor_; }
  RouteGenerator &routes() { return *routes_; }
  HealthAggregator &health_aggregator() { return *health_; }

private:
  void reconcile();

  FleetConfig config_;
  std::shared_ptr<InstanceRegistry> registry_;
  std::shared_ptr<ProxyEngine> engine_;
  std::shared_ptr<PortAllocator> allocator_;
  std::shared_ptr<ProcessSupervisor> supervisor_;
  std::shared_ptr<RouteGenerator> routes_;
  std::shared_ptr<HealthAggregator> health_;
};

} // namespace dtfleet
