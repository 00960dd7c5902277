// control/control.h
#pragma once
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "common/book.h"
#include "common/schema.h"
#include "common/timers.h"
#include "dispatch/dispatch.h"
#include "feed/registry.h"
#include "feed/schedule.h"
#include "reputation/reputation.h"
#include "route/route.h"
#include "telemetry/telemetry.h"
#include "validate/validate.h"
#include "witness/witness.h"

struct CtrlConfig
{
  double sim_seconds = 1000.0;   // run budget in simulation time
  uint32_t stats_interval = 100; // ticks between stats rows
  double event_window = 0.5;     // an event fires when due < now + window
  double fake_offset_x = 500.0;  // fake location offset, uniform +-x
  double fake_offset_y = 200.0;  // and +-y around the malicious vehicle
  uint32_t seed = 4242;
  RouteConfig route{};
  WitnessConfig witness{};
  ValidateConfig validate{};
  RepConfig rep{};
  DispatchConfig dispatch{};
};

// Everything one tick produced, in pipeline order.
struct TickOutput
{
  uint64_t tick{0};
  double time{0.0};
  std::vector<ValidatedEntry> validated;
  std::vector<DispatchEvent> dispatches;
  Confusion eval;               // ground truth vs verdict for this tick
  std::optional<StatsRow> stats; // every stats_interval ticks
};

struct RunCounters
{
  uint64_t total_reports{0};
  uint64_t dropped_reports{0};
  uint64_t fake_reports{0};
  uint64_t real_incidents{0};
  uint64_t witness_reports{0};
  uint64_t detected_fakes{0};
  uint64_t emergency_dispatches{0};
  uint64_t duplicate_validations{0};
  uint64_t skipped_events{0}; // malformed timers
  uint64_t absent_events{0};  // vehicle left before its event fired
};

// Drives one run: snapshot -> incident / fake hooks -> routing ->
// corroboration -> validation -> dispatch -> stats.
class IncidentController
{
public:
  explicit IncidentController(const CtrlConfig &c);

  // One full tick. False once sim_seconds is exceeded; the snapshot is then
  // ignored and `out` is left empty.
  bool step(const EntitySnapshot &snap, TickOutput &out);

  // step() split in stages so validation can run elsewhere (MPI).
  bool begin_tick(const EntitySnapshot &snap, TickOutput &out);
  void validate_local(TickOutput &out);
  void collect_jobs(std::vector<std::vector<ScoreJob>> &per_node);
  void apply_results(const std::vector<ScoreResult> &results, TickOutput &out);
  void end_tick(TickOutput &out);

  // Report hooks; both return the report index, or nullopt when the vehicle
  // has no position this tick.
  std::optional<ReportIdx> raise_incident(const std::string &vehicle, ReportType type, double t);
  std::optional<ReportIdx> raise_fake(const std::string &vehicle, ReportType type, double t);

  [[nodiscard]] RunCounters counters() const;
  [[nodiscard]] StatsRow stats_row(double t) const;

  [[nodiscard]] const ReportBook &book() const { return book_; }
  [[nodiscard]] const VehicleRegistry &registry() const { return registry_; }
  [[nodiscard]] const CoverageRouter &router() const { return router_; }
  [[nodiscard]] const ReputationStore &reputation() const { return rep_; }
  [[nodiscard]] const Dispatcher &dispatcher() const { return dispatcher_; }

private:
  void fire(const ScheduledEvent &ev, double now);

  CtrlConfig cfg_;
  std::mt19937 rng_;
  ReportBook book_;
  VehicleRegistry registry_;
  EventSchedule schedule_;
  ReputationStore rep_;
  CoverageRouter router_;
  WitnessCorroborator witness_;
  ValidationEngine engine_;
  Dispatcher dispatcher_;

  std::vector<ScheduledEvent> due_;
  uint64_t ticks_{0};
  uint64_t fake_reports_{0};
  uint64_t real_incidents_{0};
  uint64_t absent_events_{0};
};

// Hands one tick's output to the sink.
void publish(const TickOutput &out, TelemetrySink &sink);

// End-of-run summary on stdout.
void print_summary(const RunCounters &c, const Confusion &eval);
