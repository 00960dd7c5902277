// telemetry/telemetry.cpp
#include "telemetry/telemetry.h"
#include <cerrno>
#include <cstring>
#include "common/log.h"
#include "telemetry/records.h"

TelemetrySink::TelemetrySink(const TelemetryConfig &c) : cfg_(c)
{
  if (cfg_.out_dir.empty())
    return;
  stats_ = open("simulation_stats.tsv");
  dispatch_ = open("dispatches.tsv");
}

TelemetrySink::FilePtr TelemetrySink::open(const char *name)
{
  const std::string path = cfg_.out_dir + "/" + name;
  FilePtr f(std::fopen(path.c_str(), "w"));
  if (!f)
    LOG("[TELEMETRY] cannot open %s: %s (rows kept in memory)", path.c_str(), std::strerror(errno));
  return f;
}

void TelemetrySink::add(const Confusion &c)
{
  confusion_.true_pos += c.true_pos;
  confusion_.false_pos += c.false_pos;
  confusion_.true_neg += c.true_neg;
  confusion_.false_neg += c.false_neg;
}

void TelemetrySink::on_dispatch(const DispatchEvent &d)
{
  ++dispatches_;
  if (dispatch_)
    std::fprintf(dispatch_.get(), "%s\n", format_dispatch(d).c_str());
}

void TelemetrySink::on_stats(const StatsRow &s)
{
  rows_.push_back(s);
  std::printf("[STATS @ %.0fs] vehicles=%u reports=%llu fake=%llu detected=%llu accuracy=%.2f%%\n",
              s.timestamp, s.active_vehicles,
              static_cast<unsigned long long>(s.total_reports),
              static_cast<unsigned long long>(s.fake_reports),
              static_cast<unsigned long long>(s.detected_fakes),
              100.0 * s.detection_accuracy);
  std::fflush(stdout);
  if (stats_)
    std::fprintf(stats_.get(), "%s\n", format_stats(s).c_str());
}

void TelemetrySink::write_reports(const ReportBook &book)
{
  if (cfg_.out_dir.empty())
    return;
  FilePtr f = open("incident_reports.tsv");
  if (!f)
    return;
  size_t n = 0;
  for (const auto &r : book)
  {
    if (!r.rsu_id)
      continue; // dropped at admission
    std::fprintf(f.get(), "%s\n", format_report(r).c_str());
    ++n;
  }
  LOG("[TELEMETRY] wrote %zu report record(s) to %s/incident_reports.tsv", n, cfg_.out_dir.c_str());
}

void TelemetrySink::flush()
{
  if (stats_)
    std::fflush(stats_.get());
  if (dispatch_)
    std::fflush(dispatch_.get());
}
