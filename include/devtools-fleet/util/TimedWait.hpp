#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace dtfleet {
namespace util {

/// Shared cancellation flag. Copies observe the same flag.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() { flag_->store(true); }
  bool is_cancelled() const { return flag_->load(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

enum class WaitOutcome {
  Satisfied, // predicate returned true
  Aborted,   // abort predicate fired (e.g. the process exited)
  TimedOut,  // deadline or attempt budget exhausted
  Cancelled, // token cancelled
};

/// Bounded polling wait.
///
/// Evaluates `ready` up to `max_attempts` times. Between attempts it calls
/// `pause(interval)`, which must block for at most `interval` and return true
/// if waiting should stop early (abort). The wait never runs past `deadline`.
struct PollOptions {
  int max_attempts{30};
  std::chrono::milliseconds interval{1000};
  std::chrono::steady_clock::time_point deadline{
      std::chrono::steady_clock::time_point::max()};
};

WaitOutcome
poll_until(const std::function<bool()> &ready,
           const std::function<bool(std::chrono::milliseconds)> &pause,
           const PollOptions &options,
           const CancellationToken &token = CancellationToken());

/// Sleep for `duration`, waking early on cancellation. Returns false if the
/// token was cancelled before the full duration elapsed.
bool sleep_for(std::chrono::milliseconds duration,
               const CancellationToken &token);

/// Milliseconds remaining until `deadline` (zero if already past).
std::chrono::milliseconds
remaining(std::chrono::steady_clock::time_point deadline);

} // namespace util
} // namespace dtfleet
