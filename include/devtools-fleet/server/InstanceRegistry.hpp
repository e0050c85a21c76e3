#pragma once
#include "devtools-fleet/types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dtfleet {

/// Durable record of live instances: one JSON file per instance under
/// `<runDir>/instances/chrome-<port>.json`, surviving manager restarts.
///
/// Each write goes to a temporary file that is renamed over the record, so
/// readers never observe a partial record. Liveness checks belong to
/// ProcessSupervisor::reconcile(); the registry only stores.
class InstanceRegistry {
public:
  explicit InstanceRegistry(std::string run_dir);

  std::string instances_dir() const;
  std::string record_path(uint16_t port) const;

  bool save(const Instance &instance);
  std::optional<Instance> load(uint16_t port) const;

  /// All readable records ordered by port. Unparseable records are removed.
  std::vector<Instance> load_all() const;

  /// Remove the record for `port`. Missing records are not an error.
  bool remove(uint16_t port) const;

  bool contains(uint16_t port) const;
  std::set<uint16_t> ports() const;

private:
  std::string run_dir_;
};

nlohmann::json instance_to_json(const Instance &instance);
Instance instance_from_json(const nlohmann::json &j);

} // namespace dtfleet
