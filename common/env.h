// common/env.h
#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>

// Environment overrides. Missing or out-of-range values yield the default.

inline uint32_t env_u32(const char *n, uint32_t d)
{
  if (const char *e = std::getenv(n))
  {
    char *end = nullptr;
    long v = std::strtol(e, &end, 10);
    if (end != e && v > 0 && v < 100000000)
      return (uint32_t)v;
  }
  return d;
}

inline double env_f64(const char *n, double d, double lo, double hi)
{
  if (const char *e = std::getenv(n))
  {
    char *end = nullptr;
    double v = std::strtod(e, &end);
    if (end != e && v >= lo && v <= hi)
      return v;
  }
  return d;
}

inline bool env_flag(const char *n, bool d)
{
  if (const char *e = std::getenv(n))
  {
    std::string s(e);
    if (s == "1" || s == "true" || s == "on")
      return true;
    if (s == "0" || s == "false" || s == "off")
      return false;
  }
  return d;
}

inline std::string env_str(const char *n, const char *d)
{
  if (const char *e = std::getenv(n))
    return std::string(e);
  return std::string(d);
}
