// common/ids.h
#pragma once
#include <cstdint>

// Message tags (MPI)
inline constexpr int TAG_JOBS = 20;    // score jobs for one tick
inline constexpr int TAG_VERDICT = 21; // score results for one tick
inline constexpr int TAG_CTRL = 22;    // tick header / stop

// Roles for MPI ranks
enum class Role : int
{
  Coordinator = 0,
  Validator = 1
};

// Tick header value that tells validators to leave their loop.
inline constexpr int CTRL_STOP = -1;
