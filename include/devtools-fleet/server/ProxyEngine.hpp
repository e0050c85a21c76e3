#pragma once
#include "devtools-fleet/FleetConfig.hpp"
#include "devtools-fleet/types.hpp"

namespace dtfleet {

/// The reverse proxy that serves generated routes. Implementations must be
/// able to check the whole configuration set without activating it, and to
/// hot-reload it.
class ProxyEngine {
public:
  virtual ~ProxyEngine() = default;

  /// Syntax/semantic check of the configuration set as it is on disk.
  virtual OperationResult validate() = 0;

  /// Apply the configuration set without dropping other routes.
  virtual OperationResult reload() = 0;
};

/// Proxy engine driven by shell commands (`nginx -t`, `nginx -s reload` by
/// default). Exit status 0 is success; output is kept for the message.
class CommandProxyEngine : public ProxyEngine {
public:
  explicit CommandProxyEngine(const ProxyConfig &config);

  OperationResult validate() override;
  OperationResult reload() override;

private:
  OperationResult run(const std::string &command, FleetError on_failure,
                      const char *step);

  const ProxyConfig &config_;
};

} // namespace dtfleet
