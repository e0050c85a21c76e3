#include "devtools-fleet/ipc/FileLock.hpp"
#include "devtools-fleet/Logger.hpp"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/interprocess/exceptions.hpp>
#include <filesystem>
#include <fstream>
#include <map>

namespace dtfleet {
namespace ipc {

namespace {

std::timed_mutex &local_mutex_for(const std::string &path) {
  static std::mutex registry_mutex;
  static std::map<std::string, std::unique_ptr<std::timed_mutex>> mutexes;

  std::lock_guard<std::mutex> lock(registry_mutex);
  auto &slot = mutexes[path];
  if (!slot) {
    slot = std::make_unique<std::timed_mutex>();
  }
  return *slot;
}

} // namespace

ScopedFileLock::ScopedFileLock(const std::string &path,
                               std::chrono::milliseconds timeout)
    : path_(path) {
  auto started = std::chrono::steady_clock::now();

  local_ = std::unique_lock<std::timed_mutex>(local_mutex_for(path),
                                              std::defer_lock);
  if (!local_.try_lock_for(timeout)) {
    LOG_ERROR("LOCK", "TIMEOUT", "Timed out waiting for {} in this process",
              path);
    return;
  }

  std::error_code ec;
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
  }
  {
    std::ofstream touch(path, std::ios::app);
    if (!touch) {
      LOG_ERROR("LOCK", "CREATE", "Cannot create lock file {}", path);
      local_.unlock();
      return;
    }
  }

  auto left = timeout - std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - started);
  if (left.count() < 0)
    left = std::chrono::milliseconds(0);

  try {
    file_lock_ = std::make_unique<boost::interprocess::file_lock>(path.c_str());
    auto abs_time = boost::posix_time::microsec_clock::universal_time() +
                    boost::posix_time::milliseconds(left.count());
    locked_ = file_lock_->timed_lock(abs_time);
  } catch (const boost::interprocess::interprocess_exception &ex) {
    LOG_ERROR("LOCK", "ACQUIRE", "file_lock on {} failed: {}", path, ex.what());
    locked_ = false;
  }

  if (!locked_) {
    LOG_ERROR("LOCK", "TIMEOUT", "Could not lock {} within {}ms", path,
              timeout.count());
    file_lock_.reset();
    local_.unlock();
    return;
  }
  LOG_TRACE("LOCK", "ACQUIRE", "Locked {}", path);
}

ScopedFileLock::~ScopedFileLock() {
  if (locked_ && file_lock_) {
    try {
      file_lock_->unlock();
    } catch (const boost::interprocess::interprocess_exception &ex) {
      LOG_WARN("LOCK", "RELEASE", "Unlock of {} failed: {}", path_, ex.what());
    }
  }
  // Close the descriptor before another thread may open one on the same file
  file_lock_.reset();
  if (local_.owns_lock()) {
    local_.unlock();
  }
}

} // namespace ipc
} // namespace dtfleet
