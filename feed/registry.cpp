// feed/registry.cpp
#include "feed/registry.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include "common/log.h"

namespace
{
  inline uint8_t bit(EventKind k) { return static_cast<uint8_t>(1u << static_cast<unsigned>(k)); }

  const TimerParam *find_param(const VehicleRecord &rec, const char *key)
  {
    for (const auto &p : rec.timers)
      if (p.key == key)
        return &p;
    return nullptr;
  }

  // Whole-string finite number, nothing else.
  std::optional<double> parse_time(const std::string &s)
  {
    if (s.empty())
      return std::nullopt;
    char *end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !std::isfinite(v))
      return std::nullopt;
    return v;
  }
} // namespace

VehicleRole role_from_flags(uint8_t flags)
{
  if (flags & ROLE_MALICIOUS)
    return VehicleRole::Malicious;
  if (flags & ROLE_EMERGENCY)
    return VehicleRole::Emergency;
  if (flags & ROLE_HONEST)
    return VehicleRole::Honest;
  return VehicleRole::Unclassified;
}

void VehicleRegistry::update(const EntitySnapshot &snap, EventSchedule &sched)
{
  positions_.clear();
  positions_.reserve(snap.vehicles.size());
  for (const auto &rec : snap.vehicles)
    positions_[rec.id] = rec.pos;

  // Departures first so a re-used id starts a fresh lifetime.
  for (auto it = vehicles_.begin(); it != vehicles_.end();)
  {
    if (positions_.count(it->first) == 0)
      it = vehicles_.erase(it);
    else
      ++it;
  }

  for (const auto &rec : snap.vehicles)
  {
    auto [slot, fresh] = vehicles_.try_emplace(rec.id);
    TrackedVehicle &tv = slot->second;
    if (fresh)
      tv.lifetime = ++lifetimes_;
    if (tv.role == VehicleRole::Unclassified)
    {
      tv.role = role_from_flags(rec.role_flags);
      if (tv.role != VehicleRole::Unclassified)
        LOGD("[FEED] %s classified as %d at t=%.1f", rec.id.c_str(), static_cast<int>(tv.role), snap.time);
    }
    schedule_timers(rec, tv, sched);
  }
}

void VehicleRegistry::schedule_timers(const VehicleRecord &rec, TrackedVehicle &tv, EventSchedule &sched)
{
  struct Slot
  {
    const char *key;
    EventKind kind;
  };
  static constexpr Slot kSlots[] = {
      {"breakdown_time", EventKind::Breakdown},
      {"crash_time", EventKind::Crash},
      {"fake_report_time", EventKind::FakeReport},
  };

  for (const auto &slot : kSlots)
  {
    const uint8_t b = bit(slot.kind);
    if (tv.scheduled & b)
      continue;
    const TimerParam *p = find_param(rec, slot.key);
    if (!p)
      continue; // no such event for this vehicle

    auto due = parse_time(p->value);
    std::optional<ReportType> fake_type = ReportType::Accident;
    if (slot.kind == EventKind::FakeReport)
    {
      const TimerParam *t = find_param(rec, "fake_report_type");
      fake_type = t ? parse_report_type(t->value) : std::nullopt;
    }

    if (!due || !fake_type)
    {
      // Not yet due; counted once per vehicle and event kind.
      if (!(tv.malformed & b))
      {
        tv.malformed |= b;
        ++malformed_;
        LOGD("[FEED] malformed %s for %s: '%s'", slot.key, rec.id.c_str(), p->value.c_str());
      }
      continue;
    }

    ScheduledEvent ev;
    ev.due = *due;
    ev.vehicle = rec.id;
    ev.lifetime = tv.lifetime;
    ev.kind = slot.kind;
    ev.fake_type = *fake_type;
    sched.push(std::move(ev));
    tv.scheduled |= b;
  }
}

std::optional<Vec2> VehicleRegistry::position(const std::string &id) const
{
  auto it = positions_.find(id);
  if (it == positions_.end())
    return std::nullopt;
  return it->second;
}

VehicleRole VehicleRegistry::role(const std::string &id) const
{
  auto it = vehicles_.find(id);
  return it == vehicles_.end() ? VehicleRole::Unclassified : it->second.role;
}

std::optional<uint64_t> VehicleRegistry::lifetime(const std::string &id) const
{
  auto it = vehicles_.find(id);
  if (it == vehicles_.end())
    return std::nullopt;
  return it->second.lifetime;
}

void VehicleRegistry::honest_within(const Vec2 &c, double radius, std::vector<std::string> &out) const
{
  out.clear();
  for (const auto &[id, tv] : vehicles_)
  {
    if (tv.role != VehicleRole::Honest)
      continue;
    auto pos = position(id);
    if (pos && distance(*pos, c) < radius)
      out.push_back(id);
  }
  std::sort(out.begin(), out.end());
}
