#include "devtools-fleet/ipc/ProcessHandle.hpp"
#include "devtools-fleet/Logger.hpp"
#include "devtools-fleet/util/TimedWait.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <fstream>
#include <poll.h>
#include <spawn.h>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char **environ;

namespace dtfleet {
namespace ipc {

namespace {

constexpr auto POLL_SLICE = std::chrono::milliseconds(50);

std::vector<char *> make_argv(const std::vector<std::string> &args) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);
  return argv;
}

// 'Z' (zombie) or 'X' (dead) in /proc/<pid>/stat. Unknown counts as running.
bool proc_reports_dead(ProcessId pid) {
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  if (!stat)
    return false;
  std::string content;
  std::getline(stat, content);
  // The state field follows the parenthesised command name
  auto close_paren = content.rfind(')');
  if (close_paren == std::string::npos || close_paren + 2 >= content.size())
    return false;
  char state = content[close_paren + 2];
  return state == 'Z' || state == 'X';
}

// Spawn attributes shared by instance launches and proxy commands: own
// process group, default signal dispositions, empty signal mask.
class SpawnAttributes {
public:
  explicit SpawnAttributes(bool new_group) {
    posix_spawnattr_init(&attr_);
    short flags = POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF;
    if (new_group) {
      flags |= POSIX_SPAWN_SETPGROUP;
      posix_spawnattr_setpgroup(&attr_, 0);
    }
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    posix_spawnattr_setsigmask(&attr_, &empty_mask);

    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGTERM);
    sigaddset(&defaults, SIGINT);
    sigaddset(&defaults, SIGHUP);
    sigaddset(&defaults, SIGPIPE);
    posix_spawnattr_setsigdefault(&attr_, &defaults);

    posix_spawnattr_setflags(&attr_, flags);
  }
  ~SpawnAttributes() { posix_spawnattr_destroy(&attr_); }

  SpawnAttributes(const SpawnAttributes &) = delete;
  SpawnAttributes &operator=(const SpawnAttributes &) = delete;

  posix_spawnattr_t *get() { return &attr_; }

private:
  posix_spawnattr_t attr_;
};

class FileActions {
public:
  FileActions() { posix_spawn_file_actions_init(&actions_); }
  ~FileActions() { posix_spawn_file_actions_destroy(&actions_); }

  FileActions(const FileActions &) = delete;
  FileActions &operator=(const FileActions &) = delete;

  posix_spawn_file_actions_t *get() { return &actions_; }

private:
  posix_spawn_file_actions_t actions_;
};

} // namespace

ProcessHandle ProcessHandle::spawn(const SpawnOptions &options,
                                   std::string *error) {
  if (options.argv.empty()) {
    if (error)
      *error = "empty argument list";
    return ProcessHandle();
  }

  FileActions actions;
  const std::string output =
      options.output_path.empty() ? "/dev/null" : options.output_path;
  posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_addopen(actions.get(), STDOUT_FILENO,
                                   output.c_str(),
                                   O_WRONLY | O_CREAT | O_APPEND, 0644);
  posix_spawn_file_actions_adddup2(actions.get(), STDOUT_FILENO,
                                   STDERR_FILENO);

  SpawnAttributes attributes(options.new_process_group);
  auto argv = make_argv(options.argv);

  pid_t pid = 0;
  int status = posix_spawn(&pid, argv[0], actions.get(), attributes.get(),
                           argv.data(), environ);
  if (status != 0) {
    LOG_ERROR("PROCESS", "SPAWN", "posix_spawn {} failed: {}", options.argv[0],
              std::strerror(status));
    if (error)
      *error = std::string("posix_spawn failed: ") + std::strerror(status);
    return ProcessHandle();
  }

  LOG_DEBUG("PROCESS", "SPAWN", "Spawned {} as PID={}", options.argv[0], pid);
  return ProcessHandle(pid);
}

ProcessHandle ProcessHandle::adopt(ProcessId pid) { return ProcessHandle(pid); }

bool ProcessHandle::is_alive() const {
  if (pid_ <= 0 || exited_)
    return false;

  int status = 0;
  pid_t result = waitpid(pid_, &status, WNOHANG);
  if (result == pid_) {
    exited_ = true;
    if (WIFEXITED(status)) {
      exit_status_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      exit_status_ = 128 + WTERMSIG(status);
    }
    return false;
  }
  if (result == 0)
    return true; // our child, still running

  // Not our child: probe with signal 0
  if (kill(pid_, 0) != 0 && errno == ESRCH) {
    exited_ = true;
    return false;
  }
  if (proc_reports_dead(pid_))
    return false;
  return true;
}

bool ProcessHandle::signal(Signal kind) const {
  if (pid_ <= 0)
    return false;

  int sig = kind == Signal::Force ? SIGKILL : SIGTERM;
  bool group_leader = getpgid(pid_) == pid_;
  int rc = group_leader ? kill(-pid_, sig) : kill(pid_, sig);
  if (rc != 0 && errno != ESRCH) {
    LOG_WARN("PROCESS", "SIGNAL", "kill({}, {}) failed: {}", pid_, sig,
             std::strerror(errno));
    return false;
  }
  return rc == 0;
}

bool ProcessHandle::wait_for_exit(std::chrono::milliseconds timeout) const {
  auto deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {
    if (!is_alive())
      return true;
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return false;
    auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(left, POLL_SLICE));
  }
}

CommandResult run_command(const std::string &command,
                          std::chrono::milliseconds timeout) {
  CommandResult result;

  int pipe_fds[2];
  if (pipe2(pipe_fds, O_CLOEXEC) != 0) {
    result.output = std::string("pipe failed: ") + std::strerror(errno);
    return result;
  }

  FileActions actions;
  posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(actions.get(), pipe_fds[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(actions.get(), pipe_fds[1], STDERR_FILENO);
  posix_spawn_file_actions_addclose(actions.get(), pipe_fds[0]);
  posix_spawn_file_actions_addclose(actions.get(), pipe_fds[1]);

  SpawnAttributes attributes(true);
  std::vector<std::string> args = {"/bin/sh", "-c", command};
  auto argv = make_argv(args);

  pid_t pid = 0;
  int status = posix_spawn(&pid, argv[0], actions.get(), attributes.get(),
                           argv.data(), environ);
  close(pipe_fds[1]);
  if (status != 0) {
    close(pipe_fds[0]);
    result.output = std::string("posix_spawn failed: ") + std::strerror(status);
    return result;
  }
  result.spawned = true;

  auto deadline = std::chrono::steady_clock::now() + timeout;
  char buf[4096];
  bool eof = false;
  while (!eof) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      result.timed_out = true;
      break;
    }
    auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    struct pollfd pfd = {pipe_fds[0], POLLIN, 0};
    int ready = poll(&pfd, 1, static_cast<int>(std::min<int64_t>(
                                  left.count(), POLL_SLICE.count())));
    if (ready < 0 && errno != EINTR)
      break;
    if (ready <= 0)
      continue;
    ssize_t n = read(pipe_fds[0], buf, sizeof(buf));
    if (n > 0) {
      result.output.append(buf, static_cast<size_t>(n));
    } else if (n == 0 || errno != EINTR) {
      eof = true;
    }
  }
  close(pipe_fds[0]);

  ProcessHandle handle = ProcessHandle::adopt(pid);
  if (result.timed_out) {
    LOG_WARN("PROCESS", "COMMAND", "Command timed out after {}ms: {}",
             timeout.count(), command);
    handle.signal(Signal::Force);
  }

  // Output closed; the shell may still be exiting
  auto reap_timeout =
      result.timed_out ? std::chrono::milliseconds(2000) : util::remaining(deadline);
  if (!handle.wait_for_exit(reap_timeout)) {
    handle.signal(Signal::Force);
    handle.wait_for_exit(std::chrono::milliseconds(2000));
    result.timed_out = true;
  }
  if (auto code = handle.exit_status()) {
    result.exit_code = *code;
  }
  return result;
}

std::optional<std::string> read_cmdline(ProcessId pid) {
  std::ifstream in("/proc/" + std::to_string(pid) + "/cmdline",
                   std::ios::binary);
  if (!in)
    return std::nullopt;
  std::string raw((std::istreambuf_iterator<char>(in)),
                  std::istreambuf_iterator<char>());
  std::replace(raw.begin(), raw.end(), '\0', ' ');
  while (!raw.empty() && raw.back() == ' ')
    raw.pop_back();
  return raw;
}

std::vector<ProcessId> find_processes_matching(const std::string &needle) {
  std::vector<ProcessId> matches;
  DIR *proc = opendir("/proc");
  if (!proc) {
    LOG_WARN("PROCESS", "SCAN", "/proc unavailable, skipping process scan");
    return matches;
  }

  const ProcessId self = getpid();
  while (struct dirent *entry = readdir(proc)) {
    const char *name = entry->d_name;
    if (!std::all_of(name, name + std::strlen(name),
                     [](char c) { return c >= '0' && c <= '9'; })) {
      continue;
    }
    ProcessId pid = static_cast<ProcessId>(std::atoi(name));
    if (pid <= 0 || pid == self)
      continue;
    auto cmdline = read_cmdline(pid);
    if (cmdline && cmdline->find(needle) != std::string::npos &&
        !proc_reports_dead(pid)) {
      matches.push_back(pid);
    }
  }
  closedir(proc);
  return matches;
}

} // namespace ipc
} // namespace dtfleet
