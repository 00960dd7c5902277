// feed/schedule.cpp
#include "feed/schedule.h"

void EventSchedule::push(ScheduledEvent ev)
{
  ev.seq = next_seq_++;
  heap_.push(std::move(ev));
}

void EventSchedule::pop_due(double now, std::vector<ScheduledEvent> &out)
{
  out.clear();
  const double horizon = now + window_;
  while (!heap_.empty() && heap_.top().due < horizon)
  {
    out.push_back(heap_.top());
    heap_.pop();
  }
}
