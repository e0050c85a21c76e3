#pragma once
#include "devtools-fleet/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace dtfleet {
namespace ipc {

enum class Signal { Graceful, Force };

struct SpawnOptions {
  std::vector<std::string> argv; // argv[0] is the executable path
  std::string output_path;       // stdout+stderr, appended; empty: /dev/null
  bool new_process_group{true};
};

/// Liveness, signalling and bounded waiting for one OS process.
///
/// Works both for children spawned by this process (reaped through waitpid)
/// and for processes adopted from the instance registry after a manager
/// restart (probed with kill(pid, 0) and /proc).
class ProcessHandle {
public:
  ProcessHandle() = default;

  /// Spawn a process. Returns an invalid handle (pid 0) on failure and
  /// stores the reason in `error` when provided.
  static ProcessHandle spawn(const SpawnOptions &options,
                             std::string *error = nullptr);

  /// Wrap an existing pid (e.g. loaded from the registry).
  static ProcessHandle adopt(ProcessId pid);

  bool valid() const { return pid_ > 0; }
  ProcessId pid() const { return pid_; }

  bool is_alive() const;

  /// Deliver SIGTERM (Graceful) or SIGKILL (Force). Process-group leaders are
  /// signalled as a group so browser helper processes go too.
  bool signal(Signal kind) const;

  /// Block until the process exits or `timeout` elapses. True if it exited.
  bool wait_for_exit(std::chrono::milliseconds timeout) const;

  /// Exit status once a child has been reaped.
  std::optional<int> exit_status() const { return exit_status_; }

private:
  explicit ProcessHandle(ProcessId pid) : pid_(pid) {}

  ProcessId pid_{0};
  mutable bool exited_{false};
  mutable std::optional<int> exit_status_;
};

struct CommandResult {
  bool spawned{false};
  bool timed_out{false};
  int exit_code{-1};
  std::string output; // combined stdout/stderr

  bool ok() const { return spawned && !timed_out && exit_code == 0; }
};

/// Run `command` through /bin/sh -c, capturing combined output. The command
/// is killed if it runs longer than `timeout`.
CommandResult run_command(const std::string &command,
                          std::chrono::milliseconds timeout);

/// Command line of `pid` with arguments joined by spaces, if readable.
std::optional<std::string> read_cmdline(ProcessId pid);

/// Pids of live processes whose command line contains `needle`.
std::vector<ProcessId> find_processes_matching(const std::string &needle);

} // namespace ipc
} // namespace dtfleet
