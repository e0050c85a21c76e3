#pragma once
#include <boost/interprocess/sync/file_lock.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace dtfleet {
namespace ipc {

/// Exclusive cross-process lock on a lock file, held for the lifetime of the
/// object.
///
/// fcntl-style file locks do not exclude threads of the same process, so
/// each lock path is paired with a process-wide mutex taken first.
class ScopedFileLock {
public:
  explicit ScopedFileLock(
      const std::string &path,
      std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));
  ~ScopedFileLock();

  ScopedFileLock(const ScopedFileLock &) = delete;
  ScopedFileLock &operator=(const ScopedFileLock &) = delete;

  /// False if the lock file could not be created or the timeout elapsed.
  bool locked() const { return locked_; }
  const std::string &path() const { return path_; }

private:
  std::string path_;
  std::unique_lock<std::timed_mutex> local_;
  std::unique_ptr<boost::interprocess::file_lock> file_lock_;
  bool locked_{false};
};

} // namespace ipc
} // namespace dtfleet
