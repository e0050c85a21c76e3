#include "devtools-fleet/server/ProcessSupervisor.hpp"
#include "devtools-fleet/Logger.hpp"
#include "devtools-fleet/ipc/ProcessHandle.hpp"
#include "devtools-fleet/net/HttpProbe.hpp"
#include "devtools-fleet/server/InstanceRegistry.hpp"
#include "devtools-fleet/server/PortAllocator.hpp"

#include <algorithm>
#include <deque>
#include <fmt/ranges.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace dtfleet {

namespace {

constexpr auto FORCE_KILL_WAIT = std::chrono::milliseconds(5000);

// Fixed launch flags after the port/address/profile triple
const std::vector<std::string> FIXED_BROWSER_FLAGS = {
    "--headless=new",
    "--no-sandbox",
    "--disable-gpu",
    "--disable-dev-shm-usage",
    "--disable-extensions",
    "--disable-plugins",
    "--disable-images",
    "--disable-javascript",
    "--virtual-time-budget=5000",
    "--run-all-compositor-stages-before-draw",
    "--disable-background-timer-throttling",
    "--disable-renderer-backgrounding",
    "--disable-backgrounding-occluded-windows",
    "--disable-features=TranslateUI,VizDisplayCompositor",
    "--enable-logging",
    "--log-level=0",
    "--no-first-run",
    "--no-default-browser-check",
    "--disable-default-apps",
};

bool is_executable(const std::string &path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

} // namespace

ProcessSupervisor::ProcessSupervisor(const FleetConfig &config,
                                     std::shared_ptr<InstanceRegistry> registry)
    : config_(config), registry_(std::move(registry)) {}

std::optional<std::string>
ProcessSupervisor::find_browser(const BrowserConfig &browser,
                                std::string *error) {
  if (!browser.binary.empty()) {
    if (is_executable(browser.binary))
      return browser.binary;
    if (error)
      *error = "Configured browser is not executable: " + browser.binary;
    return std::nullopt;
  }

  for (const auto &candidate : browser.candidates) {
    if (is_executable(candidate)) {
      LOG_DEBUG("SUPERVISOR", "BROWSER", "Using {}", candidate);
      return candidate;
    }
  }

  if (error)
    *error = "No browser executable found among " +
             std::to_string(browser.candidates.size()) + " candidates";
  return std::nullopt;
}

std::string ProcessSupervisor::probe_host(const BrowserConfig &browser) {
  const auto &addr = browser.debugging_address;
  if (addr.empty() || addr == "0.0.0.0")
    return "127.0.0.1";
  return addr;
}

std::string ProcessSupervisor::data_dir_for(uint16_t port) const {
  return (fs::path(config_.paths.data_root) /
          ("chrome-" + std::to_string(port)))
      .string();
}

std::string ProcessSupervisor::log_path_for(uint16_t port) const {
  return (fs::path(config_.paths.log_dir) /
          ("chrome-" + std::to_string(port) + ".log"))
      .string();
}

std::vector<std::string> ProcessSupervisor::build_arguments(
    uint16_t port, const std::string &browser,
    const std::vector<std::string> &extra_args) const {
  std::vector<std::string> argv = {
      browser,
      "--remote-debugging-port=" + std::to_string(port),
      "--remote-debugging-address=" + config_.browser.debugging_address,
      "--user-data-dir=" + data_dir_for(port),
  };
  argv.insert(argv.end(), FIXED_BROWSER_FLAGS.begin(),
              FIXED_BROWSER_FLAGS.end());
  argv.insert(argv.end(), config_.browser.extra_args.begin(),
              config_.browser.extra_args.end());
  argv.insert(argv.end(), extra_args.begin(), extra_args.end());
  return argv;
}

std::vector<std::string> ProcessSupervisor::tail_lines(const std::string &path,
                                                       int count) {
  std::deque<std::string> lines;
  std::ifstream in(path);
  std::string line;
  while (count > 0 && std::getline(in, line)) {
    lines.push_back(line);
    if (static_cast<int>(lines.size()) > count)
      lines.pop_front();
  }
  return {lines.begin(), lines.end()};
}

bool ProcessSupervisor::has_signature(const std::string &cmdline,
                                      const Instance &instance) const {
  std::string padded = " " + cmdline + " ";
  return padded.find(" --user-data-dir=" + instance.data_dir + " ") !=
             std::string::npos &&
         padded.find(" --remote-debugging-port=" +
                     std::to_string(instance.port) + " ") != std::string::npos;
}

bool ProcessSupervisor::is_instance_alive(const Instance &instance) const {
  auto handle = ipc::ProcessHandle::adopt(instance.pid);
  if (!handle.is_alive())
    return false;

  auto cmdline = ipc::read_cmdline(instance.pid);
  if (!cmdline) {
    // No /proc entry to compare against; trust the liveness probe
    return true;
  }
  if (!has_signature(*cmdline, instance)) {
    LOG_WARN("SUPERVISOR", "SIGNATURE",
             "PID={} no longer belongs to the instance on port {}",
             instance.pid, instance.port);
    return false;
  }
  return true;
}

void ProcessSupervisor::remove_instance_files(uint16_t port, bool keep_log) {
  registry_->remove(port);

  std::error_code ec;
  fs::remove_all(data_dir_for(port), ec);
  if (ec) {
    LOG_WARN("SUPERVISOR", "CLEANUP", "Cannot remove data dir for port {}: {}",
             port, ec.message());
  }
  if (!keep_log) {
    fs::remove(log_path_for(port), ec);
    if (ec) {
      LOG_WARN("SUPERVISOR", "CLEANUP", "Cannot remove log for port {}: {}",
               port, ec.message());
    }
  }
}

SpawnResult ProcessSupervisor::spawn(uint16_t port,
                                     const std::vector<std::string> &extra_args,
                                     const util::CancellationToken &token) {
  SpawnResult result;

  // Preconditions, checked before touching anything
  if (auto existing = registry_->load(port)) {
    if (is_instance_alive(*existing)) {
      result.status = OperationResult::failure(
          FleetError::SpawnFailed,
          fmt::format("Port {} is in use by tracked instance PID={}", port,
                      existing->pid));
      LOG_ERROR("SUPERVISOR", "SPAWN", "{}", result.status.message);
      return result;
    }
  }
  if (!PortAllocator::is_port_free(port)) {
    result.status = OperationResult::failure(
        FleetError::SpawnFailed,
        fmt::format("Port {} is in use by another listener", port));
    LOG_ERROR("SUPERVISOR", "SPAWN", "{}", result.status.message);
    return result;
  }

  std::string find_error;
  auto browser = find_browser(config_.browser, &find_error);
  if (!browser) {
    result.status =
        OperationResult::failure(FleetError::BrowserNotFound, find_error);
    LOG_ERROR("SUPERVISOR", "BROWSER", "{}", find_error);
    return result;
  }

  // A dead record left behind for this port is replaced below
  if (registry_->contains(port)) {
    LOG_INFO("SUPERVISOR", "SPAWN", "Replacing stale record for port {}",
             port);
    registry_->remove(port);
  }

  Instance instance;
  instance.port = port;
  instance.data_dir = data_dir_for(port);
  instance.log_path = log_path_for(port);
  instance.browser = *browser;
  instance.state = InstanceState::Starting;

  std::error_code ec;
  fs::create_directories(instance.data_dir, ec);
  if (ec) {
    result.status = OperationResult::failure(
        FleetError::SpawnFailed,
        fmt::format("Port {}: cannot create data dir {}: {}", port,
                    instance.data_dir, ec.message()));
    LOG_ERROR("SUPERVISOR", "SPAWN", "{}", result.status.message);
    return result;
  }
  fs::create_directories(fs::path(instance.log_path).parent_path(), ec);
  {
    std::ofstream truncate(instance.log_path, std::ios::trunc);
    if (!truncate) {
      remove_instance_files(port, true);
      result.status = OperationResult::failure(
          FleetError::SpawnFailed,
          fmt::format("Port {}: cannot open log {}", port, instance.log_path));
      LOG_ERROR("SUPERVISOR", "SPAWN", "{}", result.status.message);
      return result;
    }
  }

  ipc::SpawnOptions options;
  options.argv = build_arguments(port, *browser, extra_args);
  options.output_path = instance.log_path;
  LOG_DEBUG("SUPERVISOR", "SPAWN", "Command: {}",
            fmt::join(options.argv, " "));

  std::string spawn_error;
  auto handle = ipc::ProcessHandle::spawn(options, &spawn_error);
  if (!handle.valid()) {
    remove_instance_files(port, true);
    result.status = OperationResult::failure(
        FleetError::SpawnFailed,
        fmt::format("Port {}: launch failed: {}", port, spawn_error));
    return result;
  }

  instance.pid = handle.pid();
  instance.started_at = utc_timestamp();
  if (!registry_->save(instance)) {
    handle.signal(ipc::Signal::Force);
    handle.wait_for_exit(FORCE_KILL_WAIT);
    remove_instance_files(port, true);
    result.status = OperationResult::failure(
        FleetError::SpawnFailed,
        fmt::format("Port {}: cannot persist registry record", port));
    return result;
  }
  LOG_INFO("SUPERVISOR", "SPAWN", "Started PID={} on port {}", instance.pid,
           port);

  const std::string host = probe_host(config_.browser);
  const auto probe_timeout =
      std::min(config_.health.http_timeout, config_.supervisor.readiness_interval);

  util::PollOptions poll;
  poll.max_attempts = config_.supervisor.readiness_attempts;
  poll.interval = config_.supervisor.readiness_interval;

  auto outcome = util::poll_until(
      [&] {
        return net::http_get(host, port, "/json/version", probe_timeout)
            .success();
      },
      [&](std::chrono::milliseconds pause) {
        return handle.wait_for_exit(pause);
      },
      poll, token);

  switch (outcome) {
  case util::WaitOutcome::Satisfied:
    instance.state = InstanceState::Ready;
    if (!registry_->save(instance)) {
      result.status.warnings.push_back(
          fmt::format("Port {}: READY state not persisted", port));
    }
    LOG_INFO("SUPERVISOR", "READY", "Instance on port {} is ready", port);
    result.status.success = true;
    result.status.message = fmt::format("Instance ready on port {}", port);
    result.instance = instance;
    return result;

  case util::WaitOutcome::Aborted: {
    auto tail = tail_lines(instance.log_path, config_.supervisor.log_tail_lines);
    result.log_tail = fmt::format("{}", fmt::join(tail, "\n"));
    auto code = handle.exit_status();
    result.status = OperationResult::failure(
        FleetError::SpawnFailed,
        fmt::format("Port {}: process PID={} exited during startup{}", port,
                    instance.pid,
                    code ? fmt::format(" (status {})", *code) : std::string()));
    LOG_ERROR("SUPERVISOR", "SPAWN", "{}", result.status.message);
    remove_instance_files(port, true);
    return result;
  }

  case util::WaitOutcome::TimedOut:
  case util::WaitOutcome::Cancelled:
    break;
  }

  bool cancelled = outcome == util::WaitOutcome::Cancelled;
  handle.signal(ipc::Signal::Force);
  if (!handle.wait_for_exit(FORCE_KILL_WAIT)) {
    LOG_ERROR("SUPERVISOR", "KILL", "PID={} survived SIGKILL", instance.pid);
  }
  result.log_tail = fmt::format(
      "{}", fmt::join(tail_lines(instance.log_path,
                                 config_.supervisor.log_tail_lines),
                      "\n"));
  remove_instance_files(port, true);

  if (cancelled) {
    result.status = OperationResult::failure(
        FleetError::SpawnFailed,
        fmt::format("Port {}: startup cancelled", port));
  } else {
    result.status = OperationResult::failure(
        FleetError::ReadinessTimeout,
        fmt::format("Port {}: /json/version not ready after {} attempts", port,
                    config_.supervisor.readiness_attempts));
  }
  LOG_ERROR("SUPERVISOR", "READINESS", "{}", result.status.message);
  return result;
}

OperationResult ProcessSupervisor::terminate(uint16_t port) {
  auto instance = registry_->load(port);
  if (!instance) {
    LOG_DEBUG("SUPERVISOR", "TERMINATE", "Port {} is not tracked", port);
    std::error_code ec;
    fs::remove_all(data_dir_for(port), ec);
    return OperationResult::ok(fmt::format("Port {} not tracked", port));
  }

  OperationResult result = OperationResult::ok();
  auto handle = ipc::ProcessHandle::adopt(instance->pid);

  if (is_instance_alive(*instance)) {
    LOG_INFO("SUPERVISOR", "TERMINATE", "Stopping PID={} on port {}",
             instance->pid, port);
    handle.signal(ipc::Signal::Graceful);

    if (!handle.wait_for_exit(config_.supervisor.grace_period)) {
      LOG_WARN("SUPERVISOR", "ESCALATE",
               "PID={} on port {} ignored SIGTERM for {}ms, sending SIGKILL",
               instance->pid, port, config_.supervisor.grace_period.count());
      handle.signal(ipc::Signal::Force);
      result.error = FleetError::TerminationEscalated;
      result.warnings.push_back(
          fmt::format("Port {}: forced kill after grace period", port));

      if (!handle.wait_for_exit(FORCE_KILL_WAIT)) {
        result = OperationResult::failure(
            FleetError::TerminationEscalated,
            fmt::format("Port {}: PID={} still alive after SIGKILL", port,
                        instance->pid));
        LOG_ERROR("SUPERVISOR", "TERMINATE", "{}", result.message);
      }
    }
  } else {
    // Reap it if it is our zombie child
    handle.is_alive();
    LOG_DEBUG("SUPERVISOR", "TERMINATE", "Port {} process already gone", port);
  }

  remove_instance_files(port, false);
  if (result.success) {
    result.message = fmt::format("Stopped instance on port {}", port);
    LOG_INFO("SUPERVISOR", "TERMINATE", "{}", result.message);
  }
  return result;
}

OperationResult ProcessSupervisor::terminate_all() {
  OperationResult result = OperationResult::ok();
  int stopped = 0;

  for (uint16_t port : registry_->ports()) {
    auto one = terminate(port);
    result.warnings.insert(result.warnings.end(), one.warnings.begin(),
                           one.warnings.end());
    if (!one.success) {
      result.success = false;
      result.error = one.error;
      result.message = one.message;
    }
    ++stopped;
  }

  // Instances that escaped the registry
  std::string signature =
      "--user-data-dir=" + (fs::path(config_.paths.data_root) / "").string();
  auto strays = ipc::find_processes_matching(signature);
  if (!strays.empty()) {
    LOG_WARN("SUPERVISOR", "SWEEP", "Stopping {} untracked instance processes",
             strays.size());
    for (auto pid : strays)
      ipc::ProcessHandle::adopt(pid).signal(ipc::Signal::Graceful);

    auto deadline =
        std::chrono::steady_clock::now() + config_.supervisor.grace_period;
    for (auto pid : strays) {
      auto handle = ipc::ProcessHandle::adopt(pid);
      if (!handle.wait_for_exit(util::remaining(deadline))) {
        handle.signal(ipc::Signal::Force);
        handle.wait_for_exit(FORCE_KILL_WAIT);
        result.warnings.push_back(
            fmt::format("Untracked PID={} needed a forced kill", pid));
      }
    }
  }

  // Leftover profile directories
  std::error_code ec;
  if (fs::is_directory(config_.paths.data_root, ec)) {
    for (const auto &entry :
         fs::directory_iterator(config_.paths.data_root, ec)) {
      if (entry.is_directory() &&
          entry.path().filename().string().rfind("chrome-", 0) == 0) {
        std::error_code rm_ec;
        fs::remove_all(entry.path(), rm_ec);
        if (rm_ec) {
          LOG_WARN("SUPERVISOR", "CLEANUP", "Cannot remove {}: {}",
                   entry.path().string(), rm_ec.message());
        }
      }
    }
  }

  if (result.success) {
    result.message = fmt::format("Stopped {} tracked instances", stopped);
  }
  LOG_INFO("SUPERVISOR", "TERMINATE_ALL", "Stopped {} tracked, {} untracked",
           stopped, strays.size());
  return result;
}

void ProcessSupervisor::discard_stale(uint16_t port) {
  remove_instance_files(port, true);
}

std::vector<uint16_t> ProcessSupervisor::reconcile() {
  std::vector<uint16_t> removed;
  for (const auto &instance : registry_->load_all()) {
    if (is_instance_alive(instance))
      continue;
    LOG_INFO("SUPERVISOR", "RECONCILE",
             "Removing stale record for port {} (PID={})", instance.port,
             instance.pid);
    discard_stale(instance.port);
    removed.push_back(instance.port);
  }
  return removed;
}

} // namespace dtfleet
