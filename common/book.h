// common/book.h
#pragma once
#include <deque>
#include "common/schema.h"

// Append-only owner of every report created during a run. Indices are stable
// and references stay valid across add(), so RSU queues hold indices only.
class ReportBook
{
public:
  ReportIdx add(IncidentReport r)
  {
    reports_.push_back(std::move(r));
    return static_cast<ReportIdx>(reports_.size() - 1);
  }

  IncidentReport &at(ReportIdx i) { return reports_.at(i); }
  const IncidentReport &at(ReportIdx i) const { return reports_.at(i); }

  [[nodiscard]] size_t size() const { return reports_.size(); }

  auto begin() const { return reports_.begin(); }
  auto end() const { return reports_.end(); }

private:
  std::deque<IncidentReport> reports_;
};
