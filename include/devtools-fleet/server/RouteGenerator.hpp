#pragma once
#include "devtools-fleet/FleetConfig.hpp"
#include "devtools-fleet/types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dtfleet {

class ProxyEngine;

/// Renders, validates and activates per-instance proxy routes.
///
/// The configuration set in `proxy.conf_dir` is only ever reloaded after the
/// engine validated it; a candidate that fails validation is removed again
/// (and any same-port route it replaced is put back), so the proxy keeps
/// serving the last valid set. All mutations run under
/// `<runDir>/routes.lock`.
class RouteGenerator {
public:
  RouteGenerator(const FleetConfig &config,
                 std::shared_ptr<ProxyEngine> engine);

  /// Substitute `{{NAME}}` placeholders. Unknown placeholders are left as is.
  static std::string render(const std::string &template_text,
                            const std::map<std::string, std::string> &vars);

  /// Placeholder values for `port`: PORT, PROXY_PORT, UPSTREAM_HOST.
  std::map<std::string, std::string> variables_for(uint16_t port) const;

  std::string route_path(uint16_t port) const;
  /// Route listen port: `port` plus the configured offset. May exceed 65535;
  /// activate() rejects such ports.
  uint32_t proxy_port(uint16_t port) const;

  OperationResult activate(uint16_t port);
  OperationResult deactivate(uint16_t port);
  OperationResult deactivate_all();

  /// Validate the current set as it is, without changing it.
  OperationResult validate_current();

  /// Route files present in conf_dir, ordered by port.
  std::vector<RouteRecord> list_routes() const;
  bool has_route(uint16_t port) const;

private:
  std::string lock_path() const;

  const FleetConfig &config_;
  std::shared_ptr<ProxyEngine> engine_;
};

} // namespace dtfleet
