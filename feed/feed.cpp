// feed/feed.cpp
#include "feed/feed.h"
#include <cstdio>

namespace
{
  constexpr double kMinSpeed = 20.0; // m/s
  constexpr double kMaxSpeed = 33.0;
  constexpr double kTimerMin = 5.0;  // seconds after spawn
  constexpr double kTimerMax = 300.0;
  const char *kFakeTypes[] = {"accident", "breakdown", "hazard"};
}

MobilityFeed::MobilityFeed(const FeedConfig &cfg) : cfg_(cfg), rng_(cfg.seed)
{
  clock_.step_s = cfg_.step_s;
  std::uniform_real_distribution<double> x0(0.0, cfg_.road_length);
  fleet_.reserve(cfg_.vehicles);
  for (uint32_t i = 0; i < cfg_.vehicles; ++i)
    fleet_.push_back(spawn(0.0, x0(rng_)));
}

std::string MobilityFeed::timer_value(double due)
{
  std::uniform_real_distribution<double> u(0.0, 1.0);
  if (u(rng_) < cfg_.malformed_ratio)
    return "n/a";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", due);
  return buf;
}

MobilityFeed::SimVehicle MobilityFeed::spawn(double t, double x)
{
  std::uniform_real_distribution<double> u(0.0, 1.0);
  std::uniform_real_distribution<double> lane(-cfg_.half_width, cfg_.half_width);
  std::uniform_real_distribution<double> speed(kMinSpeed, kMaxSpeed);
  std::uniform_real_distribution<double> when(t + kTimerMin, t + kTimerMax);

  SimVehicle v;
  char id[32];
  std::snprintf(id, sizeof(id), "veh_%llu", static_cast<unsigned long long>(next_id_++));
  v.rec.id = id;
  v.rec.pos = Vec2{x, lane(rng_)};
  v.speed = speed(rng_);

  if (u(rng_) < cfg_.fake_ratio)
  {
    v.rec.role_flags = ROLE_MALICIOUS;
    v.rec.timers.push_back({"fake_report_time", timer_value(when(rng_))});
    v.rec.timers.push_back({"fake_report_type", kFakeTypes[static_cast<size_t>(u(rng_) * 3.0) % 3]});
  }
  else if (u(rng_) < cfg_.emergency_ratio)
  {
    v.rec.role_flags = ROLE_EMERGENCY;
  }
  else if (u(rng_) < cfg_.honest_ratio)
  {
    v.rec.role_flags = ROLE_HONEST;
  }

  if (v.rec.role_flags != ROLE_MALICIOUS && u(rng_) < cfg_.incident_ratio)
  {
    const char *key = u(rng_) < 0.5 ? "breakdown_time" : "crash_time";
    v.rec.timers.push_back({key, timer_value(when(rng_))});
  }
  return v;
}

bool MobilityFeed::next(EntitySnapshot &out)
{
  const double t = clock_.now();
  if (t > cfg_.duration_s)
    return false;

  if (clock_.tick > 0)
  {
    for (auto &v : fleet_)
    {
      v.rec.pos.x += v.speed * cfg_.step_s;
      if (v.rec.pos.x > cfg_.road_length)
        v = spawn(t, 0.0); // leaves; a new vehicle enters
    }
  }

  out.tick = clock_.tick;
  out.time = t;
  out.vehicles.clear();
  out.vehicles.reserve(fleet_.size());
  for (const auto &v : fleet_)
    out.vehicles.push_back(v.rec);

  clock_.advance();
  return true;
}
