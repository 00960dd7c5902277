// witness/witness.cpp
#include "witness/witness.h"
#include "common/log.h"

WitnessCorroborator::WitnessCorroborator(const WitnessConfig &c) : cfg_(c) {}

size_t WitnessCorroborator::corroborate(ReportIdx incident, ReportBook &book,
                                        const VehicleRegistry &reg, CoverageRouter &router)
{
  // Witness sets only grow before the incident itself is routed.
  const IncidentReport &src = book.at(incident);
  if (src.is_fake || src.rsu_id || src.validated())
    return 0;
  const std::string reporter = src.reporter;
  const ReportType type = src.type;
  const Vec2 loc = src.location;
  const double ts = src.timestamp;

  reg.honest_within(loc, cfg_.radius, scratch_);

  size_t n = 0;
  for (const auto &wid : scratch_)
  {
    if (wid == reporter)
      continue;

    IncidentReport w;
    w.reporter = wid;
    w.type = type;
    w.location = loc;
    w.timestamp = ts;
    w.is_fake = false;
    const ReportIdx widx = book.add(std::move(w));

    book.at(incident).witnesses.push_back(wid);
    router.route(book, widx);
    ++n;
  }

  created_ += n;
  if (n > 0)
    LOGD("[WITNESS] %zu witness report(s) for %s at t=%.1f", n, reporter.c_str(), ts);
  return n;
}
