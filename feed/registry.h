// feed/registry.h
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "common/schema.h"
#include "feed/schedule.h"

// Per-vehicle state that outlives a single snapshot.
struct TrackedVehicle
{
  VehicleRole role{VehicleRole::Unclassified};
  uint64_t lifetime{0}; // bumped each time the id (re)enters the feed
  uint8_t scheduled{0}; // bit per EventKind already queued
  uint8_t malformed{0}; // bit per EventKind already counted as malformed
};

// Working set of vehicles currently in the feed. Roles are sticky (first
// flagged sighting wins); a vehicle that disappears is forgotten entirely.
class VehicleRegistry
{
public:
  // Applies one snapshot. Timer fields are parsed here and queued on `sched`;
  // unparseable timers are counted and retried on later ticks.
  void update(const EntitySnapshot &snap, EventSchedule &sched);

  [[nodiscard]] std::optional<Vec2> position(const std::string &id) const;
  [[nodiscard]] VehicleRole role(const std::string &id) const;
  // Lifetime of the tracked id; events queued in an earlier one are stale.
  [[nodiscard]] std::optional<uint64_t> lifetime(const std::string &id) const;

  // Honest vehicles strictly within `radius` of `c`, sorted by id.
  void honest_within(const Vec2 &c, double radius, std::vector<std::string> &out) const;

  [[nodiscard]] const std::unordered_map<std::string, Vec2> &positions() const { return positions_; }
  [[nodiscard]] size_t active() const { return positions_.size(); }
  [[nodiscard]] uint64_t malformed_timers() const { return malformed_; }

private:
  void schedule_timers(const VehicleRecord &rec, TrackedVehicle &tv, EventSchedule &sched);

  std::unordered_map<std::string, TrackedVehicle> vehicles_;
  std::unordered_map<std::string, Vec2> positions_; // rebuilt every tick
  uint64_t malformed_{0};
  uint64_t lifetimes_{0};
};

// Role implied by a set of feed flags (Malicious > Emergency > Honest).
VehicleRole role_from_flags(uint8_t flags);
