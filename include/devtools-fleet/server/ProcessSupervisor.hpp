#pragma once
#include "devtools-fleet/FleetConfig.hpp"
#include "devtools-fleet/types.hpp"
#include "devtools-fleet/util/TimedWait.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dtfleet {

class InstanceRegistry;

struct SpawnResult {
  OperationResult status;
  std::optional<Instance> instance;
  std::string log_tail; // last lines of the instance log on SpawnFailed
};

/// Spawns browser instances bound to one port each, waits for their
/// debugging endpoint, and tears them down.
///
/// Every instance is described by its registry record; the supervisor keeps
/// no in-memory state, so a later invocation can terminate what an earlier
/// one started.
class ProcessSupervisor {
public:
  ProcessSupervisor(const FleetConfig &config,
                    std::shared_ptr<InstanceRegistry> registry);

  /// Browser executable: `browser.binary` if set, else the first executable
  /// candidate. nullopt (with a reason in `error`) when none is usable.
  static std::optional<std::string> find_browser(const BrowserConfig &browser,
                                                 std::string *error = nullptr);

  /// Full argument vector (argv[0] = browser) for an instance on `port`.
  std::vector<std::string>
  build_arguments(uint16_t port, const std::string &browser,
                  const std::vector<std::string> &extra_args) const;

  /// Launch an instance on `port` and wait until /json/version answers.
  SpawnResult spawn(uint16_t port, const std::vector<std::string> &extra_args,
                    const util::CancellationToken &token = {});

  /// Stop the instance on `port` and remove its registry record, data
  /// directory and log. Unknown or already-dead ports succeed.
  OperationResult terminate(uint16_t port);

  /// terminate() every registry entry, then sweep untracked processes that
  /// carry the instance signature and leftover data directories.
  OperationResult terminate_all();

  /// Drop registry entries whose process is gone or whose pid now belongs
  /// to something else. Returns the ports removed.
  std::vector<uint16_t> reconcile();

  /// Remove the record and data directory of an instance found dead.
  /// The log is kept for diagnosis.
  void discard_stale(uint16_t port);

  /// Process alive and still carrying this instance's signature.
  bool is_instance_alive(const Instance &instance) const;

  /// Address the manager uses to reach an instance's debugging port.
  static std::string probe_host(const BrowserConfig &browser);

  std::string data_dir_for(uint16_t port) const;
  std::string log_path_for(uint16_t port) const;

  /// Last `count` lines of `path` (fewer if the file is shorter).
  static std::vector<std::string> tail_lines(const std::string &path,
                                             int count);

private:
  bool has_signature(const std::string &cmdline, const Instance &instance) const;
  void remove_instance_files(uint16_t port, bool keep_log);

  const FleetConfig &config_;
  std::shared_ptr<InstanceRegistry> registry_;
};

} // namespace dtfleet
