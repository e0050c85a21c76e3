#include "devtools-fleet/util/TimedWait.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace dtfleet::util;
using namespace std::chrono_literals;

TEST(TimedWait, SatisfiedOnThirdAttempt) {
  int attempts = 0;
  int pauses = 0;
  PollOptions options;
  options.max_attempts = 10;
  options.interval = 1ms;

  auto outcome = poll_until([&] { return ++attempts == 3; },
                            [&](std::chrono::milliseconds) {
                              ++pauses;
                              return false;
                            },
                            options);

  EXPECT_EQ(outcome, WaitOutcome::Satisfied);
  EXPECT_EQ(attempts, 3);
  EXPECT_EQ(pauses, 2);
}

TEST(TimedWait, AttemptBudgetWithoutTrailingPause) {
  int attempts = 0;
  int pauses = 0;
  PollOptions options;
  options.max_attempts = 4;
  options.interval = 1ms;

  auto outcome = poll_until([&] {
    ++attempts;
    return false;
  },
                            [&](std::chrono::milliseconds) {
                              ++pauses;
                              return false;
                            },
                            options);

  EXPECT_EQ(outcome, WaitOutcome::TimedOut);
  EXPECT_EQ(attempts, 4);
  EXPECT_EQ(pauses, 3);
}

TEST(TimedWait, AbortFromPause) {
  int attempts = 0;
  PollOptions options;
  options.max_attempts = 30;
  options.interval = 1000ms;

  auto started = std::chrono::steady_clock::now();
  auto outcome = poll_until([&] {
    ++attempts;
    return false;
  },
                            [](std::chrono::milliseconds) { return true; },
                            options);

  EXPECT_EQ(outcome, WaitOutcome::Aborted);
  EXPECT_EQ(attempts, 1);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 500ms);
}

TEST(TimedWait, DeadlineBoundsWait) {
  PollOptions options;
  options.max_attempts = 1000;
  options.interval = 20ms;
  options.deadline = std::chrono::steady_clock::now() + 100ms;

  auto outcome = poll_until([] { return false; },
                            [](std::chrono::milliseconds pause) {
                              std::this_thread::sleep_for(pause);
                              return false;
                            },
                            options);

  EXPECT_EQ(outcome, WaitOutcome::TimedOut);
  EXPECT_GE(std::chrono::steady_clock::now(), options.deadline);
}

TEST(TimedWait, CancelledToken) {
  CancellationToken token;
  CancellationToken copy = token;
  copy.cancel();
  EXPECT_TRUE(token.is_cancelled());

  int attempts = 0;
  auto outcome = poll_until([&] {
    ++attempts;
    return true;
  },
                            [](std::chrono::milliseconds) { return false; },
                            PollOptions{}, token);
  EXPECT_EQ(outcome, WaitOutcome::Cancelled);
  EXPECT_EQ(attempts, 0);
}

TEST(TimedWait, SleepWakesOnCancel) {
  CancellationToken token;
  std::thread canceller([token]() mutable {
    std::this_thread::sleep_for(50ms);
    token.cancel();
  });

  auto started = std::chrono::steady_clock::now();
  EXPECT_FALSE(sleep_for(5000ms, token));
  EXPECT_LT(std::chrono::steady_clock::now() - started, 2000ms);
  canceller.join();
}

TEST(TimedWait, RemainingIsZeroPastDeadline) {
  auto past = std::chrono::steady_clock::now() - 10ms;
  EXPECT_EQ(remaining(past).count(), 0);
  auto future = std::chrono::steady_clock::now() + 10s;
  EXPECT_GT(remaining(future).count(), 5000);
}
