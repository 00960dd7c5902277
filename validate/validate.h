// validate/validate.h
#pragma once
#include <atomic>
#include <cstdint>
#include <vector>
#include "common/book.h"
#include "common/schema.h"
#include "feed/registry.h"
#include "reputation/reputation.h"
#include "route/route.h"

struct ValidateConfig
{
  double fake_threshold = 0.3; // score below this => flagged
  bool parallel = false;       // validate RSU queues concurrently (OpenMP)
};

// One completed validation, in the order it was applied.
struct ValidatedEntry
{
  ReportIdx idx;
  ScoreInput in;
  Verdict v;
};

// Credibility score in [0,1] from reputation, witness count and reporter
// position. Pure; never sees the ground-truth flag.
[[nodiscard]] double score_report(const ScoreInput &in);

// Score plus classification against the fake threshold.
[[nodiscard]] Verdict judge(const ScoreInput &in, double fake_threshold);

class ValidationEngine
{
public:
  ValidationEngine(const ValidateConfig &c, ReputationStore &rep);

  // Signals for one report against current reputation. A reporter with no
  // position this tick contributes no location term.
  [[nodiscard]] ScoreInput inputs_for(const IncidentReport &r, const VehicleRegistry &reg);

  [[nodiscard]] const ValidateConfig &config() const { return cfg_; }

  // pending -> validated, once. Scores, classifies and updates reputation
  // under the reporter's lock. Returns false (and counts a duplicate) if the
  // report was already validated.
  bool validate(IncidentReport &r, const VehicleRegistry &reg, ValidatedEntry *out = nullptr);

  // Applies a verdict computed elsewhere (MPI validator ranks) against `in`.
  // If the reporter's reputation has moved since `in` was taken, the report
  // is re-judged against the current value under the same lock.
  bool apply(IncidentReport &r, const ScoreInput &in, const Verdict &v, ValidatedEntry *out = nullptr);

  // Drains every RSU queue. Results are appended node by node, in queue order.
  void drain(std::vector<Rsu> &nodes, ReportBook &book, const VehicleRegistry &reg,
             std::vector<ValidatedEntry> &out);

  // Drains every RSU queue into score jobs without validating (MPI path).
  void collect(std::vector<Rsu> &nodes, ReportBook &book, const VehicleRegistry &reg,
               std::vector<std::vector<ScoreJob>> &per_node);

  [[nodiscard]] uint64_t validated() const { return validated_.load(); }
  [[nodiscard]] uint64_t detected_fakes() const { return detected_.load(); }
  [[nodiscard]] uint64_t duplicates() const { return duplicates_.load(); }

private:
  void record(const IncidentReport &r, const Verdict &v);

  ValidateConfig cfg_;
  ReputationStore &rep_;
  std::atomic<uint64_t> validated_{0};
  std::atomic<uint64_t> detected_{0};
  std::atomic<uint64_t> duplicates_{0};
};
