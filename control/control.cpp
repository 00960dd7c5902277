// control/control.cpp
#include "control/control.h"
#include <cstdio>
#include "common/log.h"

IncidentController::IncidentController(const CtrlConfig &c)
    : cfg_(c),
      rng_(c.seed),
      schedule_(c.event_window),
      rep_(c.rep),
      router_(c.route),
      witness_(c.witness),
      engine_(c.validate, rep_),
      dispatcher_(c.dispatch) {}

bool IncidentController::step(const EntitySnapshot &snap, TickOutput &out)
{
  if (!begin_tick(snap, out))
    return false;
  validate_local(out);
  end_tick(out);
  return true;
}

bool IncidentController::begin_tick(const EntitySnapshot &snap, TickOutput &out)
{
  out = TickOutput{};
  if (snap.time > cfg_.sim_seconds)
    return false;
  out.tick = snap.tick;
  out.time = snap.time;

  // 1) working set, sticky roles, timers -> schedule
  registry_.update(snap, schedule_);

  // 2) genuine incidents and fake reports due this tick
  schedule_.pop_due(snap.time, due_);
  for (const auto &ev : due_)
    fire(ev, snap.time);

  // 3) per-RSU coverage sets
  router_.update_coverage(registry_.positions());
  return true;
}

void IncidentController::fire(const ScheduledEvent &ev, double now)
{
  // Queued before the vehicle left; a returning id has its own copy.
  if (registry_.lifetime(ev.vehicle) != ev.lifetime)
  {
    ++absent_events_;
    LOGD("[CTRL] %s left after its event was queued, skipped at t=%.1f", ev.vehicle.c_str(), now);
    return;
  }

  std::optional<ReportIdx> idx;
  switch (ev.kind)
  {
  case EventKind::Breakdown:
    idx = raise_incident(ev.vehicle, ReportType::Breakdown, now);
    break;
  case EventKind::Crash:
    idx = raise_incident(ev.vehicle, ReportType::Accident, now);
    break;
  case EventKind::FakeReport:
    if (registry_.role(ev.vehicle) != VehicleRole::Malicious)
    {
      LOGD("[CTRL] ignoring fake-report timer on non-malicious %s", ev.vehicle.c_str());
      return;
    }
    idx = raise_fake(ev.vehicle, ev.fake_type, now);
    break;
  }
  if (!idx)
  {
    ++absent_events_;
    LOGD("[CTRL] %s has no position at t=%.1f, event skipped", ev.vehicle.c_str(), now);
  }
}

std::optional<ReportIdx> IncidentController::raise_incident(const std::string &vehicle, ReportType type, double t)
{
  auto pos = registry_.position(vehicle);
  if (!pos)
    return std::nullopt;

  IncidentReport r;
  r.reporter = vehicle;
  r.type = type;
  r.location = *pos;
  r.timestamp = t;
  r.is_fake = false;
  const ReportIdx idx = book_.add(std::move(r));
  ++real_incidents_;

  const size_t w = witness_.corroborate(idx, book_, registry_, router_);
  auto rsu = router_.route(book_, idx);
  LOG("[INCIDENT] %s by %s at (%.0f,%.0f) t=%.1f | witnesses=%zu rsu=%d",
      to_string(type), vehicle.c_str(), pos->x, pos->y, t, w, rsu ? static_cast<int>(*rsu) : -1);
  return idx;
}

std::optional<ReportIdx> IncidentController::raise_fake(const std::string &vehicle, ReportType type, double t)
{
  auto pos = registry_.position(vehicle);
  if (!pos)
    return std::nullopt;

  std::uniform_real_distribution<double> dx(-cfg_.fake_offset_x, cfg_.fake_offset_x);
  std::uniform_real_distribution<double> dy(-cfg_.fake_offset_y, cfg_.fake_offset_y);

  IncidentReport r;
  r.reporter = vehicle;
  r.type = type;
  r.location = Vec2{pos->x + dx(rng_), pos->y + dy(rng_)};
  r.timestamp = t;
  r.is_fake = true;
  const Vec2 loc = r.location;
  const ReportIdx idx = book_.add(std::move(r));
  ++fake_reports_;

  auto rsu = router_.route(book_, idx);
  LOG("[FAKE] %s injected by %s at (%.0f,%.0f) t=%.1f | rsu=%d",
      to_string(type), vehicle.c_str(), loc.x, loc.y, t, rsu ? static_cast<int>(*rsu) : -1);
  return idx;
}

void IncidentController::validate_local(TickOutput &out)
{
  engine_.drain(router_.nodes(), book_, registry_, out.validated);
}

void IncidentController::collect_jobs(std::vector<std::vector<ScoreJob>> &per_node)
{
  engine_.collect(router_.nodes(), book_, registry_, per_node);
}

void IncidentController::apply_results(const std::vector<ScoreResult> &results, TickOutput &out)
{
  // Serial, in the order given: reputation deltas are never lost.
  for (const auto &res : results)
  {
    if (res.idx >= book_.size())
    {
      LOG("[CTRL] result for unknown report %u ignored", res.idx);
      continue;
    }
    ValidatedEntry e{res.idx, ScoreInput{}, Verdict{}};
    if (engine_.apply(book_.at(res.idx), res.in, res.v, &e))
      out.validated.push_back(e);
  }
}

void IncidentController::end_tick(TickOutput &out)
{
  std::vector<ReportIdx> idxs;
  idxs.reserve(out.validated.size());
  for (const auto &e : out.validated)
  {
    idxs.push_back(e.idx);
    tally(out.eval, book_.at(e.idx).is_fake, e.v.flagged != 0);
  }

  // 5) dispatch; the ledger makes repeated sweeps harmless
  dispatcher_.sweep(book_, idxs, out.dispatches);

  // 6) stats row
  ++ticks_;
  if (cfg_.stats_interval > 0 && ticks_ % cfg_.stats_interval == 0)
    out.stats = stats_row(out.time);
}

RunCounters IncidentController::counters() const
{
  RunCounters c;
  c.total_reports = router_.total_reports();
  c.dropped_reports = router_.dropped_reports();
  c.fake_reports = fake_reports_;
  c.real_incidents = real_incidents_;
  c.witness_reports = witness_.witness_reports();
  c.detected_fakes = engine_.detected_fakes();
  c.emergency_dispatches = dispatcher_.dispatched();
  c.duplicate_validations = engine_.duplicates();
  c.skipped_events = registry_.malformed_timers();
  c.absent_events = absent_events_;
  return c;
}

StatsRow IncidentController::stats_row(double t) const
{
  const RunCounters c = counters();
  StatsRow s;
  s.timestamp = t;
  s.active_vehicles = static_cast<uint32_t>(registry_.active());
  s.total_reports = c.total_reports;
  s.fake_reports = c.fake_reports;
  s.detected_fakes = c.detected_fakes;
  s.detection_accuracy = detection_accuracy(c.detected_fakes, c.fake_reports);
  return s;
}

void publish(const TickOutput &out, TelemetrySink &sink)
{
  sink.add(out.eval);
  for (const auto &d : out.dispatches)
    sink.on_dispatch(d);
  if (out.stats)
    sink.on_stats(*out.stats);
}

void print_summary(const RunCounters &c, const Confusion &eval)
{
  std::printf("============================================================\n");
  std::printf("SIMULATION FINISHED\n");
  std::printf("  total reports        %llu (dropped out of coverage: %llu)\n",
              (unsigned long long)c.total_reports, (unsigned long long)c.dropped_reports);
  std::printf("  real incidents       %llu (witness reports: %llu)\n",
              (unsigned long long)c.real_incidents, (unsigned long long)c.witness_reports);
  std::printf("  fake reports         %llu\n", (unsigned long long)c.fake_reports);
  std::printf("  detected fakes       %llu (accuracy %.2f%%)\n",
              (unsigned long long)c.detected_fakes, 100.0 * detection_accuracy(c.detected_fakes, c.fake_reports));
  std::printf("  tp/fp/tn/fn          %llu/%llu/%llu/%llu\n",
              (unsigned long long)eval.true_pos, (unsigned long long)eval.false_pos,
              (unsigned long long)eval.true_neg, (unsigned long long)eval.false_neg);
  std::printf("  emergency dispatches %llu\n", (unsigned long long)c.emergency_dispatches);
  std::printf("  skipped events       %llu malformed, %llu absent vehicle\n",
              (unsigned long long)c.skipped_events, (unsigned long long)c.absent_events);
  if (c.duplicate_validations)
    std::printf("  duplicate validations %llu\n", (unsigned long long)c.duplicate_validations);
  std::printf("============================================================\n");
  std::fflush(stdout);
}
