#pragma once
#include "devtools-fleet/FleetConfig.hpp"
#include "devtools-fleet/types.hpp"
#include "devtools-fleet/util/TimedWait.hpp"
#include <memory>
#include <set>
#include <vector>

namespace dtfleet {

class InstanceRegistry;
class ProcessSupervisor;
class RouteGenerator;

/// Multi-tier health checks for single instances and for the whole fleet.
///
/// Per-port checks run in order (process-alive, port-reachable,
/// protocol-endpoints-ok, proxy-route-ok) and stop at the first failure.
/// Fleet checks cover the proxy service and its configuration, host
/// resources and recent log errors.
class HealthAggregator {
public:
  HealthAggregator(const FleetConfig &config,
                   std::shared_ptr<InstanceRegistry> registry,
                   std::shared_ptr<ProcessSupervisor> supervisor,
                   std::shared_ptr<RouteGenerator> routes);

  /// Ports that discovery looks at: all of [start, start + full_scan_span],
  /// the rest of the range sampled at sparse_stride, and every registry and
  /// route port inside the range.
  std::set<uint16_t> scan_candidates(uint16_t start, uint16_t end) const;

  /// Candidates that accept a connection and answer /json/version.
  /// Approximate by construction: unsampled ports are never seen.
  std::set<uint16_t> discover(uint16_t start, uint16_t end) const;

  PortHealth probe(uint16_t port,
                   const util::CancellationToken &token = {}) const;

  /// Probe concurrently, at most health.max_concurrent_probes at a time,
  /// under the shared overall deadline. Probes still running or not yet
  /// started at the deadline are cancelled and reported as failed.
  std::vector<PortHealth> probe_all(const std::set<uint16_t> &ports) const;

  std::vector<CheckResult> fleet_checks(size_t discovered_count) const;

  /// Snapshot for one port (no fleet checks).
  HealthSnapshot check_port(uint16_t port) const;

  /// Discover, probe everything found plus tracked instances, run fleet
  /// checks when enabled.
  HealthSnapshot check_fleet(uint16_t start, uint16_t end) const;

  /// Worst tier over all checks: any fail -> unhealthy, any warn ->
  /// degraded, else healthy.
  static OverallHealth aggregate(const std::vector<CheckResult> &checks);
  static OverallHealth aggregate(const HealthSnapshot &snapshot);

private:
  CheckResult check_memory() const;
  CheckResult check_disk() const;
  CheckResult check_load() const;
  CheckResult check_instance_logs() const;
  CheckResult check_proxy_service() const;
  CheckResult check_proxy_log() const;

  const FleetConfig &config_;
  std::shared_ptr<InstanceRegistry> registry_;
  std::shared_ptr<ProcessSupervisor> supervisor_;
  std::shared_ptr<RouteGenerator> routes_;
};

} // namespace dtfleet
