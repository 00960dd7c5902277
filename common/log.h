// common/log.h
#pragma once
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <mutex>
#include <chrono>

// Global log mutex for line integrity.
inline std::mutex &log_mutex()
{
  static std::mutex m;
  return m;
}

// 0 = quiet, 1 = events (default), 2 = debug. Read once from IVIRS_LOG.
inline int log_level()
{
  static const int lvl = []
  {
    if (const char *e = std::getenv("IVIRS_LOG"))
    {
      long v = std::strtol(e, nullptr, 10);
      if (v >= 0 && v <= 2)
        return static_cast<int>(v);
    }
    return 1;
  }();
  return lvl;
}

inline uint64_t log_now_ms()
{
  using Clock = std::chrono::steady_clock;
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             Clock::now().time_since_epoch())
      .count();
}

template <typename... Args>
inline void log_line(int level, const char *fmt, Args... args)
{
  if (level > log_level())
    return;
  std::lock_guard<std::mutex> g(log_mutex());
  if (level >= 2)
    std::fprintf(stderr, "[%llu] ", static_cast<unsigned long long>(log_now_ms()));
  if constexpr (sizeof...(Args) == 0)
    std::fputs(fmt, stderr);
  else
    std::fprintf(stderr, fmt, args...);
  std::fputc('\n', stderr);
  std::fflush(stderr);
}

// Thread-safe single-line logger (printf-style). LOG always prints unless
// IVIRS_LOG=0; LOGD only at IVIRS_LOG=2.
template <typename... Args>
inline void LOG(const char *fmt, Args... args)
{
  log_line(1, fmt, args...);
}

template <typename... Args>
inline void LOGD(const char *fmt, Args... args)
{
  log_line(2, fmt, args...);
}
