#include "devtools-fleet/Logger.hpp"

namespace dtfleet {

FleetLogger &FleetLogger::instance() {
  static FleetLogger logger;
  return logger;
}

} // namespace dtfleet
