// tests/test_validate.cpp
#include <gtest/gtest.h>
#include <algorithm>
#include "validate/validate.h"
#include "helpers.h"

namespace
{
  ScoreInput input(double rep, uint32_t witnesses, double dist, bool has_pos = true)
  {
    return ScoreInput{rep, dist, witnesses, static_cast<uint8_t>(has_pos ? 1 : 0)};
  }

  RouteConfig two_nodes()
  {
    RouteConfig c;
    c.sites = {{0, 0}, {2000, 0}};
    c.radius = 500.0;
    return c;
  }
}

TEST(Score, FarUncorroboratedReportIsFlagged)
{
  VehicleRegistry reg;
  EventSchedule sched;
  reg.update(snap_at(0, 0.0, {veh("m", 0, 0, ROLE_MALICIOUS)}), sched);
  ReputationStore rep;
  ValidationEngine eng(ValidateConfig{}, rep);

  IncidentReport r = report("m", 600, 0);
  ValidatedEntry e{};
  ASSERT_TRUE(eng.validate(r, reg, &e));
  EXPECT_NEAR(r.trust_score, 0.0, 1e-12);
  EXPECT_EQ(e.v.flagged, 1);
  EXPECT_TRUE(r.validated());
  EXPECT_NEAR(rep.peek("m"), 0.2, 1e-12);
  EXPECT_EQ(eng.detected_fakes(), 1u);
}

TEST(Score, TrustedCorroboratedNearbyReportClampsToOne)
{
  VehicleRegistry reg;
  EventSchedule sched;
  reg.update(snap_at(0, 0.0, {veh("h", 50, 0, ROLE_HONEST)}), sched);
  ReputationStore rep;
  rep.update("h", [](double)
             { return 0.9; });
  ValidationEngine eng(ValidateConfig{}, rep);

  IncidentReport r = report("h", 0, 0);
  r.witnesses = {"a", "b", "c"};
  ASSERT_TRUE(eng.validate(r, reg));
  EXPECT_DOUBLE_EQ(r.trust_score, 1.0);
  EXPECT_DOUBLE_EQ(rep.peek("h"), 1.0);
  EXPECT_EQ(eng.detected_fakes(), 0u);
}

TEST(Score, UnknownPositionSkipsTheLocationTerm)
{
  VehicleRegistry reg; // reporter not in the feed
  ReputationStore rep;
  ValidationEngine eng(ValidateConfig{}, rep);

  IncidentReport r = report("gone", 0, 0);
  r.witnesses = {"w"};
  ASSERT_TRUE(eng.validate(r, reg));
  EXPECT_DOUBLE_EQ(r.trust_score, 0.7);
  EXPECT_NEAR(rep.peek("gone"), 0.6, 1e-12);
}

TEST(Score, MidRangeDistanceIsNeutral)
{
  EXPECT_DOUBLE_EQ(score_report(input(0.5, 1, 100.0)), 0.7);
  EXPECT_DOUBLE_EQ(score_report(input(0.5, 1, 500.0)), 0.7);
  EXPECT_NEAR(score_report(input(0.5, 1, 99.9)), 0.9, 1e-12);
  EXPECT_NEAR(score_report(input(0.5, 1, 500.1)), 0.4, 1e-12);
}

TEST(Score, AlwaysInUnitInterval)
{
  for (double rep : {0.0, 0.25, 0.5, 0.75, 1.0})
    for (uint32_t w : {0u, 1u, 2u, 9u})
      for (double d : {0.0, 250.0, 5000.0})
        for (bool pos : {false, true})
        {
          const double s = score_report(input(rep, w, d, pos));
          EXPECT_GE(s, 0.0);
          EXPECT_LE(s, 1.0);
        }
}

TEST(Score, ThresholdIsStrict)
{
  // 0.5 + 0.3 * (0.5 - 0.5) - 0.2 = 0.3 exactly at the threshold
  Verdict v = judge(input(0.5, 0, 300.0), 0.3);
  EXPECT_NEAR(v.score, 0.3, 1e-12);
  EXPECT_EQ(v.flagged, 0);
  EXPECT_EQ(judge(input(0.0, 0, 300.0), 0.3).flagged, 1);
}

TEST(Validate, GroundTruthDoesNotAffectTheScore)
{
  VehicleRegistry reg;
  ReputationStore rep;
  ValidationEngine eng(ValidateConfig{}, rep);
  IncidentReport genuine = report("a", 0, 0, 1.0, false);
  IncidentReport fake = report("b", 0, 0, 1.0, true);
  ASSERT_TRUE(eng.validate(genuine, reg));
  ASSERT_TRUE(eng.validate(fake, reg));
  EXPECT_DOUBLE_EQ(genuine.trust_score, fake.trust_score);
}

TEST(Validate, SecondValidationIsANoOp)
{
  VehicleRegistry reg;
  ReputationStore rep;
  ValidationEngine eng(ValidateConfig{}, rep);
  IncidentReport r = report("a", 0, 0);
  ASSERT_TRUE(eng.validate(r, reg));
  const double score = r.trust_score;
  const double after = rep.peek("a");

  EXPECT_FALSE(eng.validate(r, reg));
  EXPECT_FALSE(eng.apply(r, input(0.5, 0, 0.0), Verdict{0.0, 1}));
  EXPECT_DOUBLE_EQ(r.trust_score, score);
  EXPECT_DOUBLE_EQ(rep.peek("a"), after);
  EXPECT_EQ(eng.validated(), 1u);
  EXPECT_EQ(eng.duplicates(), 2u);
}

TEST(Validate, ApplyUsesTheGivenVerdict)
{
  ReputationStore rep;
  ValidationEngine eng(ValidateConfig{}, rep);
  IncidentReport r = report("a", 0, 0);
  ASSERT_TRUE(eng.apply(r, input(0.5, 0, 600.0), Verdict{0.1, 1}));
  EXPECT_DOUBLE_EQ(r.trust_score, 0.1);
  EXPECT_NEAR(rep.peek("a"), 0.2, 1e-12);
  EXPECT_EQ(eng.detected_fakes(), 1u);
}

TEST(Validate, ApplyRejudgesAgainstMovedReputation)
{
  ReputationStore rep;
  ValidationEngine eng(ValidateConfig{}, rep);
  const ScoreInput in = input(0.5, 0, 50.0); // 0.5 - 0.2 + 0.2
  const Verdict v = judge(in, 0.3);

  IncidentReport first = report("a", 0, 0, 1.0);
  IncidentReport second = report("a", 0, 0, 2.0);
  ValidatedEntry e1{}, e2{};
  ASSERT_TRUE(eng.apply(first, in, v, &e1));
  ASSERT_TRUE(eng.apply(second, in, v, &e2));

  EXPECT_DOUBLE_EQ(first.trust_score, 0.5);
  EXPECT_NEAR(e2.in.reputation, 0.6, 1e-12);
  EXPECT_NEAR(second.trust_score, 0.53, 1e-12);
  EXPECT_NEAR(e2.v.score, second.trust_score, 1e-12);
  EXPECT_NEAR(rep.peek("a"), 0.7, 1e-12);
}

TEST(Validate, DrainEmptiesQueuesInNodeOrder)
{
  VehicleRegistry reg;
  ReputationStore rep;
  ValidationEngine eng(ValidateConfig{}, rep);
  CoverageRouter router(two_nodes());
  ReportBook book;
  ReportIdx b = book.add(report("b", 2000, 0));
  ReportIdx a = book.add(report("a", 0, 0));
  ReportIdx c = book.add(report("c", 10, 0));
  router.route(book, b);
  router.route(book, a);
  router.route(book, c);

  std::vector<ValidatedEntry> out;
  eng.drain(router.nodes(), book, reg, out);
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].idx, a);
  EXPECT_EQ(out[1].idx, c);
  EXPECT_EQ(out[2].idx, b);
  for (const auto &n : router.nodes())
    EXPECT_TRUE(n.queue.empty());
  for (const auto &r : book)
    EXPECT_TRUE(r.validated());
}

TEST(Validate, SameReportQueuedTwiceIsScoredOnce)
{
  VehicleRegistry reg;
  ReputationStore rep;
  ValidateConfig cfg;
  cfg.parallel = true;
  ValidationEngine eng(cfg, rep);
  CoverageRouter router(two_nodes());
  ReportBook book;
  ReportIdx idx = book.add(report("x", 0, 0));
  router.nodes()[0].queue.push_back(idx);
  router.nodes()[1].queue.push_back(idx);

  std::vector<ValidatedEntry> out;
  eng.drain(router.nodes(), book, reg, out);
  EXPECT_EQ(out.size(), 1u);
  EXPECT_EQ(eng.validated(), 1u);
  EXPECT_EQ(eng.duplicates(), 1u);
  EXPECT_NEAR(rep.peek("x"), 0.6, 1e-12);
}

TEST(Validate, ParallelNodesSerializeUpdatesForOneReporter)
{
  // Two reports from one reporter with one timestamp land on two nodes.
  VehicleRegistry reg;
  ReputationStore rep;
  ValidateConfig cfg;
  cfg.parallel = true;
  ValidationEngine eng(cfg, rep);
  CoverageRouter router(two_nodes());
  ReportBook book;
  IncidentReport r1 = report("x", 0, 0, 7.0);
  IncidentReport r2 = report("x", 2000, 0, 7.0);
  r1.witnesses = {"a", "b"};
  r2.witnesses = {"c", "d"};
  router.route(book, book.add(r1));
  router.route(book, book.add(r2));

  std::vector<ValidatedEntry> out;
  eng.drain(router.nodes(), book, reg, out);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_NEAR(rep.peek("x"), 0.7, 1e-12);

  // one saw the initial value, the other saw the first update
  std::vector<double> seen{out[0].in.reputation, out[1].in.reputation};
  std::sort(seen.begin(), seen.end());
  EXPECT_NEAR(seen[0], 0.5, 1e-12);
  EXPECT_NEAR(seen[1], 0.6, 1e-12);
}

TEST(Validate, CollectBuildsJobsAndSkipsValidated)
{
  VehicleRegistry reg;
  EventSchedule sched;
  reg.update(snap_at(0, 0.0, {veh("a", 30, 40, ROLE_HONEST)}), sched);
  ReputationStore rep;
  ValidationEngine eng(ValidateConfig{}, rep);
  CoverageRouter router(two_nodes());
  ReportBook book;
  ReportIdx fresh = book.add(report("a", 0, 0));
  ReportIdx done = book.add(report("b", 2000, 0));
  book.at(done).status = ReportStatus::Validated;
  router.route(book, fresh);
  router.route(book, done);

  std::vector<std::vector<ScoreJob>> per_node;
  eng.collect(router.nodes(), book, reg, per_node);
  ASSERT_EQ(per_node.size(), 2u);
  ASSERT_EQ(per_node[0].size(), 1u);
  EXPECT_TRUE(per_node[1].empty());
  EXPECT_EQ(per_node[0][0].idx, fresh);
  EXPECT_EQ(per_node[0][0].in.has_position, 1);
  EXPECT_DOUBLE_EQ(per_node[0][0].in.reporter_distance, 50.0);
  EXPECT_DOUBLE_EQ(per_node[0][0].in.reputation, 0.5);
  EXPECT_EQ(eng.duplicates(), 1u);
  EXPECT_FALSE(book.at(fresh).validated());
}
