// validate/validate.cpp
#include "validate/validate.h"
#include <algorithm>
#include "common/log.h"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace
{
  constexpr double kBase = 0.5;
  constexpr double kRepWeight = 0.3; // +-0.15 band around neutral

  constexpr double kWitnessMany = 0.4; // >= 2 witnesses
  constexpr double kWitnessOne = 0.2;
  constexpr double kWitnessNone = -0.2;

  constexpr double kNearDist = 100.0;
  constexpr double kFarDist = 500.0;
  constexpr double kNearBonus = 0.2;
  constexpr double kFarPenalty = -0.3;
} // namespace

double score_report(const ScoreInput &in)
{
  double score = kBase;
  score += kRepWeight * (in.reputation - 0.5);

  if (in.witnesses >= 2)
    score += kWitnessMany;
  else if (in.witnesses == 1)
    score += kWitnessOne;
  else
    score += kWitnessNone;

  if (in.has_position)
  {
    if (in.reporter_distance < kNearDist)
      score += kNearBonus;
    else if (in.reporter_distance > kFarDist)
      score += kFarPenalty;
    // in between: plausible but unverifiable, no adjustment
  }
  return std::clamp(score, 0.0, 1.0);
}

Verdict judge(const ScoreInput &in, double fake_threshold)
{
  const double score = score_report(in);
  return Verdict{score, static_cast<uint8_t>(score < fake_threshold ? 1 : 0)};
}

ValidationEngine::ValidationEngine(const ValidateConfig &c, ReputationStore &rep)
    : cfg_(c), rep_(rep) {}

ScoreInput ValidationEngine::inputs_for(const IncidentReport &r, const VehicleRegistry &reg)
{
  ScoreInput in{};
  in.reputation = rep_.get(r.reporter);
  in.witnesses = static_cast<uint32_t>(r.witnesses.size());
  if (auto pos = reg.position(r.reporter))
  {
    in.has_position = 1;
    in.reporter_distance = distance(*pos, r.location);
  }
  return in;
}

bool ValidationEngine::validate(IncidentReport &r, const VehicleRegistry &reg, ValidatedEntry *out)
{
  const auto pos = reg.position(r.reporter);
  const RepConfig &rc = rep_.config();

  bool applied = false;
  ScoreInput in{};
  Verdict v{};
  // Status check, scoring and reputation write happen under one per-reporter
  // lock, so a report queued twice (even at two RSUs) is scored once.
  rep_.update(r.reporter, [&](double cur)
              {
    if (r.validated())
      return cur;
    in.reputation = cur;
    in.witnesses = static_cast<uint32_t>(r.witnesses.size());
    in.has_position = pos ? 1 : 0;
    in.reporter_distance = pos ? distance(*pos, r.location) : 0.0;
    v = judge(in, cfg_.fake_threshold);
    r.trust_score = v.score;
    r.status = ReportStatus::Validated;
    applied = true;
    return cur + (v.flagged ? -rc.penalty : rc.reward); });

  if (!applied)
  {
    ++duplicates_;
    return false;
  }
  record(r, v);
  if (out)
  {
    out->in = in;
    out->v = v;
  }
  return true;
}

bool ValidationEngine::apply(IncidentReport &r, const ScoreInput &in, const Verdict &v, ValidatedEntry *out)
{
  const RepConfig &rc = rep_.config();
  bool applied = false;
  ScoreInput used = in;
  Verdict got = v;
  rep_.update(r.reporter, [&](double cur)
              {
    if (r.validated())
      return cur;
    if (cur != in.reputation)
    {
      // an earlier report by the same reporter landed first this tick
      used.reputation = cur;
      got = judge(used, cfg_.fake_threshold);
    }
    r.trust_score = std::clamp(got.score, 0.0, 1.0);
    r.status = ReportStatus::Validated;
    applied = true;
    return cur + (got.flagged ? -rc.penalty : rc.reward); });

  if (!applied)
  {
    ++duplicates_;
    return false;
  }
  record(r, got);
  if (out)
  {
    out->in = used;
    out->v = got;
  }
  return true;
}

void ValidationEngine::record(const IncidentReport &r, const Verdict &v)
{
  ++validated_;
  if (v.flagged)
  {
    ++detected_;
    LOG("[VALIDATE] flagged report from %s at t=%.1f (score %.2f, rsu %d)",
        r.reporter.c_str(), r.timestamp, v.score, r.rsu_id ? static_cast<int>(*r.rsu_id) : -1);
  }
  else
  {
    LOGD("[VALIDATE] accepted report from %s at t=%.1f (score %.2f)", r.reporter.c_str(), r.timestamp, v.score);
  }
}

void ValidationEngine::drain(std::vector<Rsu> &nodes, ReportBook &book, const VehicleRegistry &reg,
                             std::vector<ValidatedEntry> &out)
{
  const int n = static_cast<int>(nodes.size());
  std::vector<std::vector<ValidatedEntry>> per(nodes.size());

// One RSU per iteration; shared state is the reputation store (per-key
// locks) and the engine's atomic counters.
#pragma omp parallel for schedule(dynamic) if (cfg_.parallel)
  for (int i = 0; i < n; ++i)
  {
    std::vector<ReportIdx> q;
    q.swap(nodes[i].queue);
    for (ReportIdx idx : q)
    {
      ValidatedEntry e{idx, ScoreInput{}, Verdict{}};
      if (validate(book.at(idx), reg, &e))
        per[i].push_back(e);
    }
  }

  for (auto &p : per)
    out.insert(out.end(), p.begin(), p.end());
}

void ValidationEngine::collect(std::vector<Rsu> &nodes, ReportBook &book, const VehicleRegistry &reg,
                               std::vector<std::vector<ScoreJob>> &per_node)
{
  per_node.assign(nodes.size(), {});
  for (size_t i = 0; i < nodes.size(); ++i)
  {
    std::vector<ReportIdx> q;
    q.swap(nodes[i].queue);
    for (ReportIdx idx : q)
    {
      const IncidentReport &r = book.at(idx);
      if (r.validated())
      {
        ++duplicates_;
        continue;
      }
      per_node[i].push_back(ScoreJob{idx, inputs_for(r, reg)});
    }
  }
}
