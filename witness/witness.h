// witness/witness.h
#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "common/book.h"
#include "feed/registry.h"
#include "route/route.h"

struct WitnessConfig
{
  double radius{200.0};
};

class WitnessCorroborator
{
public:
  explicit WitnessCorroborator(const WitnessConfig &c);

  // For a genuine incident: every honest vehicle within radius files its own
  // report (same type, location and timestamp), which is routed on its own.
  // The witness ids are appended to the incident's witness set. Fake reports
  // are refused and produce nothing. Returns the number of witness reports.
  size_t corroborate(ReportIdx incident, ReportBook &book,
                     const VehicleRegistry &reg, CoverageRouter &router);

  [[nodiscard]] uint64_t witness_reports() const { return created_; }

private:
  WitnessConfig cfg_;
  std::vector<std::string> scratch_;
  uint64_t created_{0};
};
