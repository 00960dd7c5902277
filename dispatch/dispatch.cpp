// dispatch/dispatch.cpp
#include "dispatch/dispatch.h"
#include <cstdio>
#include "common/log.h"

std::optional<DispatchKey> parse_dispatch_key(std::string_view s)
{
  if (s == "reporter_timestamp")
    return DispatchKey::ReporterAndTimestamp;
  if (s == "reporter")
    return DispatchKey::ReporterOnly;
  return std::nullopt;
}

bool DispatchLedger::insert(const std::string &key)
{
  std::lock_guard<std::mutex> g(m_);
  return keys_.insert(key).second;
}

bool DispatchLedger::contains(const std::string &key) const
{
  std::lock_guard<std::mutex> g(m_);
  return keys_.count(key) != 0;
}

size_t DispatchLedger::size() const
{
  std::lock_guard<std::mutex> g(m_);
  return keys_.size();
}

Dispatcher::Dispatcher(const DispatchConfig &c) : cfg_(c) {}

bool Dispatcher::eligible(const IncidentReport &r) const
{
  return r.validated() && r.trust_score >= cfg_.min_score;
}

std::string Dispatcher::key_for(const IncidentReport &r) const
{
  if (cfg_.key == DispatchKey::ReporterOnly)
    return r.reporter;
  // exact bits of the timestamp; '\x1f' cannot appear in a vehicle id
  char buf[40];
  std::snprintf(buf, sizeof(buf), "\x1f%.17g", r.timestamp);
  return r.reporter + buf;
}

bool Dispatcher::maybe_dispatch(const IncidentReport &r, DispatchEvent *ev)
{
  if (!eligible(r))
    return false;
  if (!ledger_.insert(key_for(r)))
    return false;

  LOG("[DISPATCH] emergency response to (%.0f,%.0f) for %s report by %s at t=%.1f",
      r.location.x, r.location.y, to_string(r.type), r.reporter.c_str(), r.timestamp);
  if (ev)
    *ev = DispatchEvent{r.reporter, r.timestamp, r.location};
  return true;
}

void Dispatcher::sweep(const ReportBook &book, const std::vector<ReportIdx> &idxs, std::vector<DispatchEvent> &out)
{
  for (ReportIdx idx : idxs)
  {
    DispatchEvent ev;
    if (maybe_dispatch(book.at(idx), &ev))
      out.push_back(std::move(ev));
  }
}
