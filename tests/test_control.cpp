// tests/test_control.cpp
#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include "control/control.h"
#include "feed/feed.h"
#include "helpers.h"

namespace
{
  CtrlConfig small_config()
  {
    CtrlConfig c;
    c.sim_seconds = 100.0;
    c.stats_interval = 0;
    return c;
  }

  // Incident by r at t=5 with two honest witnesses; m files a fake at t=3.
  std::vector<VehicleRecord> scene()
  {
    return {
        veh("r", 100, -50, ROLE_HONEST, {{"crash_time", "5"}}),
        veh("h1", 150, -50, ROLE_HONEST),
        veh("h2", 60, -40, ROLE_HONEST),
        veh("m", 1000, -50, ROLE_MALICIOUS, {{"fake_report_time", "3"}, {"fake_report_type", "hazard"}}),
    };
  }
}

TEST(Control, CorroboratedIncidentIsDispatchedOnce)
{
  IncidentController ctl(small_config());
  std::vector<DispatchEvent> dispatches;
  for (uint64_t t = 0; t <= 8; ++t)
  {
    TickOutput out;
    ASSERT_TRUE(ctl.step(snap_at(t, static_cast<double>(t), scene()), out));
    dispatches.insert(dispatches.end(), out.dispatches.begin(), out.dispatches.end());
    if (t == 5)
      EXPECT_EQ(out.validated.size(), 3u); // incident plus two witnesses
  }

  ASSERT_EQ(dispatches.size(), 1u);
  EXPECT_EQ(dispatches[0].reporter, "r");
  EXPECT_DOUBLE_EQ(dispatches[0].timestamp, 5.0);

  const RunCounters c = ctl.counters();
  EXPECT_EQ(c.real_incidents, 1u);
  EXPECT_EQ(c.witness_reports, 2u);
  EXPECT_EQ(c.fake_reports, 1u);
  EXPECT_EQ(c.emergency_dispatches, 1u);
  EXPECT_EQ(c.absent_events, 0u);

  const IncidentReport *incident = nullptr;
  for (const auto &r : ctl.book())
    if (r.reporter == "r")
      incident = &r;
  ASSERT_NE(incident, nullptr);
  EXPECT_EQ(incident->witnesses, (std::vector<std::string>{"h1", "h2"}));
  EXPECT_DOUBLE_EQ(incident->trust_score, 1.0);
  EXPECT_EQ(incident->rsu_id, std::optional<RsuId>(0));
}

TEST(Control, UncorroboratedFakeIsNeverDispatched)
{
  IncidentController ctl(small_config());
  for (uint64_t t = 0; t <= 4; ++t)
  {
    TickOutput out;
    ASSERT_TRUE(ctl.step(snap_at(t, static_cast<double>(t), scene()), out));
    EXPECT_TRUE(out.dispatches.empty());
  }

  ASSERT_EQ(ctl.book().size(), 1u);
  const IncidentReport &fake = ctl.book().at(0);
  EXPECT_EQ(fake.reporter, "m");
  EXPECT_TRUE(fake.is_fake);
  EXPECT_EQ(fake.type, ReportType::Hazard);
  EXPECT_DOUBLE_EQ(fake.timestamp, 3.0);
  EXPECT_TRUE(fake.witnesses.empty());
  EXPECT_LE(std::abs(fake.location.x - 1000.0), 500.0);
  EXPECT_LE(std::abs(fake.location.y + 50.0), 200.0);
  if (fake.rsu_id)
  {
    // neutral reputation and no witnesses: at most 0.5
    EXPECT_TRUE(fake.validated());
    EXPECT_LE(fake.trust_score, 0.5);
  }
}

TEST(Control, FlaggedFakeLowersReputation)
{
  CtrlConfig cfg = small_config();
  cfg.validate.fake_threshold = 0.6; // above the uncorroborated ceiling
  cfg.route.sites = {{1000, -50}};
  cfg.route.radius = 5000.0;
  IncidentController ctl(cfg);
  TickOutput out;
  for (uint64_t t = 0; t <= 3; ++t)
    ASSERT_TRUE(ctl.step(snap_at(t, static_cast<double>(t), scene()), out));

  ASSERT_EQ(out.validated.size(), 1u);
  EXPECT_EQ(out.validated[0].v.flagged, 1);
  EXPECT_EQ(out.eval.true_pos, 1u);
  EXPECT_NEAR(ctl.reputation().peek("m"), 0.2, 1e-12);
  EXPECT_EQ(ctl.counters().detected_fakes, 1u);
  EXPECT_DOUBLE_EQ(ctl.stats_row(3.0).detection_accuracy, 1.0);

  // m leaves and comes back: a fresh lifetime, same reputation
  ASSERT_TRUE(ctl.step(snap_at(4, 4.0, {veh("h1", 150, -50, ROLE_HONEST)}), out));
  EXPECT_EQ(ctl.registry().role("m"), VehicleRole::Unclassified);
  ASSERT_TRUE(ctl.step(snap_at(5, 5.0, {veh("m", 1000, -50, ROLE_HONEST)}), out));
  EXPECT_EQ(ctl.registry().role("m"), VehicleRole::Honest);
  EXPECT_NEAR(ctl.reputation().peek("m"), 0.2, 1e-12);
}

TEST(Control, EventForADepartedVehicleIsSkipped)
{
  IncidentController ctl(small_config());
  TickOutput out;
  ASSERT_TRUE(ctl.step(snap_at(0, 0.0, {veh("v", 0, -50, ROLE_HONEST, {{"breakdown_time", "2"}})}), out));
  ASSERT_TRUE(ctl.step(snap_at(1, 1.0, {veh("x", 0, -50)}), out));
  ASSERT_TRUE(ctl.step(snap_at(2, 2.0, {veh("x", 0, -50)}), out));
  EXPECT_EQ(ctl.counters().absent_events, 1u);
  EXPECT_EQ(ctl.counters().real_incidents, 0u);
  EXPECT_EQ(ctl.book().size(), 0u);
}

TEST(Control, ReturningVehicleFiresItsTimerOnce)
{
  IncidentController ctl(small_config());
  TickOutput out;
  const auto v = veh("v", 100, -50, ROLE_HONEST, {{"crash_time", "3"}});
  ASSERT_TRUE(ctl.step(snap_at(0, 0.0, {v}), out));
  ASSERT_TRUE(ctl.step(snap_at(1, 1.0, {veh("x", 0, -50)}), out));
  ASSERT_TRUE(ctl.step(snap_at(2, 2.0, {v}), out));
  ASSERT_TRUE(ctl.step(snap_at(3, 3.0, {v}), out));

  EXPECT_EQ(ctl.counters().real_incidents, 1u);
  EXPECT_EQ(ctl.counters().absent_events, 1u);
  ASSERT_EQ(ctl.book().size(), 1u);
  EXPECT_EQ(ctl.book().at(0).reporter, "v");
  EXPECT_DOUBLE_EQ(ctl.book().at(0).timestamp, 3.0);
}

TEST(Control, FakeTimerOnHonestVehicleIsIgnored)
{
  IncidentController ctl(small_config());
  TickOutput out;
  auto v = veh("h", 0, -50, ROLE_HONEST, {{"fake_report_time", "1"}, {"fake_report_type", "accident"}});
  ASSERT_TRUE(ctl.step(snap_at(0, 0.0, {v}), out));
  ASSERT_TRUE(ctl.step(snap_at(1, 1.0, {v}), out));
  EXPECT_EQ(ctl.counters().fake_reports, 0u);
  EXPECT_EQ(ctl.book().size(), 0u);
}

TEST(Control, StopsPastTheTimeBudget)
{
  CtrlConfig cfg = small_config();
  cfg.sim_seconds = 2.0;
  IncidentController ctl(cfg);
  TickOutput out;
  EXPECT_TRUE(ctl.step(snap_at(2, 2.0, {}), out));
  EXPECT_FALSE(ctl.step(snap_at(3, 3.0, {}), out));
  EXPECT_EQ(out.tick, 0u);
  EXPECT_TRUE(out.validated.empty());
}

TEST(Control, StatsRowEveryInterval)
{
  CtrlConfig cfg = small_config();
  cfg.stats_interval = 2;
  IncidentController ctl(cfg);
  std::vector<double> at;
  for (uint64_t t = 0; t < 5; ++t)
  {
    TickOutput out;
    ASSERT_TRUE(ctl.step(snap_at(t, static_cast<double>(t), {veh("a", 0, 0)}), out));
    if (out.stats)
    {
      at.push_back(out.stats->timestamp);
      EXPECT_EQ(out.stats->active_vehicles, 1u);
      EXPECT_DOUBLE_EQ(out.stats->detection_accuracy, 0.0);
    }
  }
  EXPECT_EQ(at, (std::vector<double>{1.0, 3.0}));
}

TEST(Control, RemoteVerdictsMatchLocalValidation)
{
  IncidentController local(small_config());
  IncidentController staged(small_config());
  for (uint64_t t = 0; t <= 6; ++t)
  {
    const EntitySnapshot s = snap_at(t, static_cast<double>(t), scene());
    TickOutput a, b;
    ASSERT_TRUE(local.step(s, a));

    ASSERT_TRUE(staged.begin_tick(s, b));
    std::vector<std::vector<ScoreJob>> per_node;
    staged.collect_jobs(per_node);
    std::vector<ScoreResult> results;
    for (const auto &jobs : per_node)
      for (const auto &j : jobs)
        results.push_back(ScoreResult{j.idx, j.in, judge(j.in, 0.3)});
    staged.apply_results(results, b);
    staged.end_tick(b);

    EXPECT_EQ(a.validated.size(), b.validated.size());
    EXPECT_EQ(a.dispatches.size(), b.dispatches.size());
  }

  ASSERT_EQ(local.book().size(), staged.book().size());
  for (ReportIdx i = 0; i < local.book().size(); ++i)
  {
    EXPECT_EQ(local.book().at(i).reporter, staged.book().at(i).reporter);
    EXPECT_DOUBLE_EQ(local.book().at(i).trust_score, staged.book().at(i).trust_score);
  }
  EXPECT_DOUBLE_EQ(local.reputation().peek("r"), staged.reputation().peek("r"));
}

TEST(Control, RemoteVerdictsSeeEarlierUpdatesInTheSameTick)
{
  // Two incidents from one reporter in one tick, each scored remotely
  // against the reputation read at collection time.
  auto run = [](bool remote)
  {
    auto ctl = std::make_unique<IncidentController>(small_config());
    TickOutput out;
    const std::vector<VehicleRecord> vs{veh("m", 100, -50, ROLE_HONEST)};
    EXPECT_TRUE(ctl->step(snap_at(0, 0.0, vs), out));

    EXPECT_TRUE(ctl->begin_tick(snap_at(1, 1.0, vs), out));
    EXPECT_TRUE(ctl->raise_incident("m", ReportType::Accident, 1.0).has_value());
    EXPECT_TRUE(ctl->raise_incident("m", ReportType::Breakdown, 1.0).has_value());
    if (remote)
    {
      std::vector<std::vector<ScoreJob>> per_node;
      ctl->collect_jobs(per_node);
      std::vector<ScoreResult> results;
      for (const auto &jobs : per_node)
        for (const auto &j : jobs)
          results.push_back(ScoreResult{j.idx, j.in, judge(j.in, 0.3)});
      ctl->apply_results(results, out);
    }
    else
    {
      ctl->validate_local(out);
    }
    ctl->end_tick(out);
    return ctl;
  };

  auto local = run(false);
  auto staged = run(true);
  ASSERT_EQ(local->book().size(), 2u);
  ASSERT_EQ(staged->book().size(), 2u);
  EXPECT_DOUBLE_EQ(local->book().at(0).trust_score, 0.5);
  EXPECT_NEAR(local->book().at(1).trust_score, 0.53, 1e-12);
  for (ReportIdx i = 0; i < 2; ++i)
    EXPECT_DOUBLE_EQ(staged->book().at(i).trust_score, local->book().at(i).trust_score);
  EXPECT_DOUBLE_EQ(staged->reputation().peek("m"), local->reputation().peek("m"));
}

TEST(Control, SyntheticRunKeepsItsBooksConsistent)
{
  FeedConfig fc;
  fc.vehicles = 200;
  fc.duration_s = 300.0;
  fc.seed = 99;
  MobilityFeed feed(fc);

  CtrlConfig cc;
  cc.sim_seconds = 300.0;
  cc.stats_interval = 50;
  cc.validate.parallel = true;
  IncidentController ctl(cc);

  EntitySnapshot s;
  Confusion eval;
  uint64_t dispatches = 0, validated = 0, rows = 0;
  while (feed.next(s))
  {
    TickOutput out;
    ASSERT_TRUE(ctl.step(s, out));
    validated += out.validated.size();
    dispatches += out.dispatches.size();
    rows += out.stats ? 1 : 0;
    eval.true_pos += out.eval.true_pos;
    eval.false_neg += out.eval.false_neg;
    eval.false_pos += out.eval.false_pos;
    eval.true_neg += out.eval.true_neg;
  }

  const RunCounters c = ctl.counters();
  EXPECT_GT(c.fake_reports, 0u);
  EXPECT_EQ(rows, 6u);
  EXPECT_EQ(c.real_incidents + c.witness_reports + c.fake_reports, ctl.book().size());
  EXPECT_EQ(c.total_reports + c.dropped_reports, ctl.book().size());
  EXPECT_EQ(validated, c.total_reports);
  EXPECT_EQ(c.duplicate_validations, 0u);
  EXPECT_EQ(c.emergency_dispatches, dispatches);
  EXPECT_EQ(eval.true_pos + eval.false_pos, c.detected_fakes);
  EXPECT_LE(eval.true_pos, c.fake_reports);

  for (const auto &r : ctl.book())
  {
    EXPECT_EQ(r.rsu_id.has_value(), r.validated());
    EXPECT_GE(r.trust_score, 0.0);
    EXPECT_LE(r.trust_score, 1.0);
    if (r.is_fake)
      EXPECT_TRUE(r.witnesses.empty());
  }

  std::vector<std::pair<std::string, double>> rep;
  ctl.reputation().snapshot(rep);
  for (const auto &[id, v] : rep)
  {
    EXPECT_GE(v, 0.0);
    EXPECT_LE(v, 1.0);
  }
}
