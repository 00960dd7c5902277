// telemetry/telemetry.h
#pragma once
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>
#include "common/book.h"
#include "common/schema.h"

struct TelemetryConfig
{
  std::string out_dir; // empty => keep rows in memory only
};

// Ground truth vs verdict, filled as reports are validated.
struct Confusion
{
  uint64_t true_pos{0};  // fake, flagged
  uint64_t false_pos{0}; // genuine, flagged
  uint64_t true_neg{0};  // genuine, accepted
  uint64_t false_neg{0}; // fake, accepted
};

inline void tally(Confusion &c, bool is_fake, bool flagged)
{
  if (is_fake)
    ++(flagged ? c.true_pos : c.false_neg);
  else
    ++(flagged ? c.false_pos : c.true_neg);
}

// detected / fakes, 0 before the first fake report.
[[nodiscard]] inline double detection_accuracy(uint64_t detected, uint64_t fakes)
{
  return fakes == 0 ? 0.0 : static_cast<double>(detected) / static_cast<double>(fakes);
}

// Append-only output for report generation. Files (when out_dir is set):
//   simulation_stats.tsv   one stats.v1 row per interval
//   dispatches.tsv         one dispatch.v1 row per emergency dispatch
//   incident_reports.tsv   every routed report, written at the end of the run
class TelemetrySink
{
public:
  explicit TelemetrySink(const TelemetryConfig &c);

  void add(const Confusion &c);
  void on_dispatch(const DispatchEvent &d);
  void on_stats(const StatsRow &s);
  void write_reports(const ReportBook &book);
  void flush();

  [[nodiscard]] const std::vector<StatsRow> &rows() const { return rows_; }
  [[nodiscard]] const Confusion &confusion() const { return confusion_; }
  [[nodiscard]] uint64_t dispatch_events() const { return dispatches_; }
  [[nodiscard]] bool writing() const { return stats_ != nullptr; }

private:
  struct FileCloser
  {
    void operator()(std::FILE *f) const
    {
      if (f)
        std::fclose(f);
    }
  };
  using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

  FilePtr open(const char *name);

  TelemetryConfig cfg_;
  FilePtr stats_;
  FilePtr dispatch_;
  std::vector<StatsRow> rows_;
  Confusion confusion_;
  uint64_t dispatches_{0};
};
