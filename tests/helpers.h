// tests/helpers.h
#pragma once
#include <initializer_list>
#include <string>
#include <vector>
#include "common/schema.h"

inline VehicleRecord veh(const std::string &id, double x, double y, uint8_t flags = ROLE_NONE,
                         std::initializer_list<TimerParam> timers = {})
{
  VehicleRecord r;
  r.id = id;
  r.pos = Vec2{x, y};
  r.role_flags = flags;
  r.timers.assign(timers.begin(), timers.end());
  return r;
}

inline EntitySnapshot snap_at(uint64_t tick, double time, std::vector<VehicleRecord> vehicles)
{
  EntitySnapshot s;
  s.tick = tick;
  s.time = time;
  s.vehicles = std::move(vehicles);
  return s;
}

inline IncidentReport report(const std::string &reporter, double x, double y, double ts = 10.0,
                             bool fake = false)
{
  IncidentReport r;
  r.reporter = reporter;
  r.type = ReportType::Accident;
  r.location = Vec2{x, y};
  r.timestamp = ts;
  r.is_fake = fake;
  return r;
}
