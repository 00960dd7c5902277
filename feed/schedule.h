// feed/schedule.h
#pragma once
#include <cstdint>
#include <queue>
#include <string>
#include <vector>
#include "common/schema.h"

enum class EventKind : uint8_t
{
  Breakdown = 0,
  Crash = 1,
  FakeReport = 2
};

struct ScheduledEvent
{
  double due{0.0};
  std::string vehicle;
  uint64_t lifetime{0}; // registry lifetime the event was queued in
  EventKind kind{EventKind::Breakdown};
  ReportType fake_type{ReportType::Accident}; // FakeReport only
  uint64_t seq{0};                            // insertion order, breaks ties
};

// Time-keyed event queue. Each event is popped exactly once, the first tick
// whose clock is within `window` of (or past) its due time.
class EventSchedule
{
public:
  explicit EventSchedule(double window = 0.5) : window_(window) {}

  void push(ScheduledEvent ev);
  // Pops every event with due < now + window, in (due, seq) order.
  void pop_due(double now, std::vector<ScheduledEvent> &out);

  [[nodiscard]] size_t pending() const { return heap_.size(); }

private:
  struct Later
  {
    bool operator()(const ScheduledEvent &a, const ScheduledEvent &b) const
    {
      if (a.due != b.due)
        return a.due > b.due;
      return a.seq > b.seq;
    }
  };

  double window_;
  uint64_t next_seq_{0};
  std::priority_queue<ScheduledEvent, std::vector<ScheduledEvent>, Later> heap_;
};
