// common/timers.h
#pragma once
#include <chrono>
#include <cstdint>
#include <thread>

using Clock = std::chrono::steady_clock;

[[nodiscard]] inline uint64_t now_ms()
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             Clock::now().time_since_epoch())
      .count();
}

// Wall-clock pacing for runs that replay the feed in real time.
inline void sleep_until_ms(uint64_t target_ms)
{
  for (;;)
  {
    uint64_t n = now_ms();
    if (n >= target_ms)
      break;
    const uint64_t remain = target_ms - n;
    if (remain > 2)
      std::this_thread::sleep_for(std::chrono::milliseconds(remain - 1));
    else
      std::this_thread::yield();
  }
}

// Wall-clock budget for one stage (used to report slow validator slices).
struct Deadline
{
  uint64_t start_ms{now_ms()};
  uint32_t budget_ms{1000};

  [[nodiscard]] inline uint64_t end_ms() const { return start_ms + budget_ms; }
  [[nodiscard]] inline bool expired() const { return now_ms() >= end_ms(); }
};

// Logical simulation clock. Time is derived from the tick count so it does
// not accumulate floating-point drift.
struct SimClock
{
  double step_s{1.0};
  uint64_t tick{0};

  [[nodiscard]] inline double now() const { return static_cast<double>(tick) * step_s; }
  inline void advance() { ++tick; }
};
