#include "devtools-fleet/util/TimedWait.hpp"

#include <algorithm>
#include <thread>

namespace dtfleet {
namespace util {

namespace {
constexpr auto SLEEP_SLICE = std::chrono::milliseconds(50);
}

std::chrono::milliseconds
remaining(std::chrono::steady_clock::time_point deadline) {
  auto now = std::chrono::steady_clock::now();
  if (now >= deadline)
    return std::chrono::milliseconds(0);
  if (deadline == std::chrono::steady_clock::time_point::max())
    return std::chrono::milliseconds::max();
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
}

bool sleep_for(std::chrono::milliseconds duration,
               const CancellationToken &token) {
  auto until = std::chrono::steady_clock::now() + duration;
  while (std::chrono::steady_clock::now() < until) {
    if (token.is_cancelled())
      return false;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        until - std::chrono::steady_clock::now());
    std::this_thread::sleep_for(std::min(left, SLEEP_SLICE));
  }
  return !token.is_cancelled();
}

WaitOutcome
poll_until(const std::function<bool()> &ready,
           const std::function<bool(std::chrono::milliseconds)> &pause,
           const PollOptions &options, const CancellationToken &token) {
  for (int attempt = 0; attempt < options.max_attempts; ++attempt) {
    if (token.is_cancelled())
      return WaitOutcome::Cancelled;

    if (ready())
      return WaitOutcome::Satisfied;

    auto left = remaining(options.deadline);
    if (left.count() == 0)
      return WaitOutcome::TimedOut;

    // No pause after the final attempt
    if (attempt + 1 == options.max_attempts)
      break;

    if (pause(std::min(options.interval, left)))
      return WaitOutcome::Aborted;
  }

  return token.is_cancelled() ? WaitOutcome::Cancelled : WaitOutcome::TimedOut;
}

} // namespace util
} // namespace dtfleet
