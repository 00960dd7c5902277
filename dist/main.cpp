// dist/main.cpp
#include <mpi.h>
#include <vector>
#include <algorithm>
#include <cstdio>
#include <cstdint>

#include "common/env.h"
#include "common/ids.h"
#include "common/log.h"
#include "common/schema.h"
#include "common/timers.h"
#include "control/config.h"
#include "control/control.h"
#include "feed/feed.h"
#include "telemetry/telemetry.h"
#include "validate/validate.h"

// Rank 0 owns the run: feed, routing, corroboration, reputation, dispatch and
// telemetry. Ranks 1..V each score the queues of the RSUs they own
// (rsu id % V == rank - 1). Verdicts come back to rank 0, which applies
// reputation updates one at a time, so none are lost.

static constexpr uint32_t BUDGET_V = 50; // ms per tick slice before we complain

static void send_jobs(int dst, const std::vector<ScoreJob> &jobs)
{
  int n = (int)jobs.size();
  MPI_Send(&n, 1, MPI_INT, dst, TAG_CTRL, MPI_COMM_WORLD);
  if (n > 0)
    MPI_Send(jobs.data(), n * (int)sizeof(ScoreJob), MPI_BYTE, dst, TAG_JOBS, MPI_COMM_WORLD);
}

static void recv_results(int src, std::vector<ScoreResult> &all)
{
  int n = 0;
  MPI_Recv(&n, 1, MPI_INT, src, TAG_VERDICT, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
  if (n <= 0)
    return;
  size_t off = all.size();
  all.resize(off + n);
  MPI_Recv(all.data() + off, n * (int)sizeof(ScoreResult), MPI_BYTE, src, TAG_VERDICT, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
}

static void run_coordinator(const RunConfig &rc, int V)
{
  MobilityFeed feed(rc.feed);
  IncidentController ctrl(rc.ctrl);
  TelemetrySink sink(rc.telemetry);

  EntitySnapshot snap;
  TickOutput out;
  std::vector<std::vector<ScoreJob>> per_node;
  std::vector<std::vector<ScoreJob>> slices(V);
  std::vector<ScoreResult> results;

  while (feed.next(snap))
  {
    uint64_t t0 = now_ms();
    if (!ctrl.begin_tick(snap, out))
      break;

    ctrl.collect_jobs(per_node);
    for (auto &s : slices)
      s.clear();
    for (size_t i = 0; i < per_node.size(); ++i)
    {
      auto &dst = slices[i % V];
      dst.insert(dst.end(), per_node[i].begin(), per_node[i].end());
    }
    for (int v = 0; v < V; ++v)
      send_jobs(v + 1, slices[v]);

    results.clear();
    for (int v = 0; v < V; ++v)
      recv_results(v + 1, results);

    ctrl.apply_results(results, out);
    ctrl.end_tick(out);
    publish(out, sink);

    if (out.stats)
    {
      std::printf("[COORD] tick %5llu | validators %d | validated=%zu dispatched=%zu | lat=%lldms\n",
                  (unsigned long long)out.tick, V, out.validated.size(), out.dispatches.size(),
                  (long long)(now_ms() - t0));
      std::fflush(stdout);
    }
  }

  int stop = CTRL_STOP;
  for (int v = 0; v < V; ++v)
    MPI_Send(&stop, 1, MPI_INT, v + 1, TAG_CTRL, MPI_COMM_WORLD);

  sink.write_reports(ctrl.book());
  sink.flush();
  print_summary(ctrl.counters(), sink.confusion());
}

static void run_validator(int rank, double fake_threshold)
{
  std::vector<ScoreJob> jobs;
  std::vector<ScoreResult> res;
  uint64_t ticks = 0, slow = 0;

  for (;;)
  {
    int n = 0;
    MPI_Recv(&n, 1, MPI_INT, 0, TAG_CTRL, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
    if (n == CTRL_STOP)
      break;

    jobs.resize(std::max(n, 0));
    if (n > 0)
      MPI_Recv(jobs.data(), n * (int)sizeof(ScoreJob), MPI_BYTE, 0, TAG_JOBS, MPI_COMM_WORLD, MPI_STATUS_IGNORE);

    Deadline dl{.start_ms = now_ms(), .budget_ms = BUDGET_V};
    res.clear();
    res.reserve(jobs.size());
    for (const auto &j : jobs)
      res.push_back(ScoreResult{j.idx, j.in, judge(j.in, fake_threshold)});
    if (dl.expired())
      ++slow;

    int m = (int)res.size();
    MPI_Send(&m, 1, MPI_INT, 0, TAG_VERDICT, MPI_COMM_WORLD);
    if (m > 0)
      MPI_Send(res.data(), m * (int)sizeof(ScoreResult), MPI_BYTE, 0, TAG_VERDICT, MPI_COMM_WORLD);
    ++ticks;
  }

  LOGD("[VALIDATOR %d] %llu ticks, %llu over budget", rank,
       (unsigned long long)ticks, (unsigned long long)slow);
}

int main(int argc, char **argv)
{
  MPI_Init(&argc, &argv);
  int world = 0, rank = 0;
  MPI_Comm_size(MPI_COMM_WORLD, &world);
  MPI_Comm_rank(MPI_COMM_WORLD, &rank);
  if (world < 2)
  {
    std::fprintf(stderr, "FATAL: need >=2 ranks (1 coordinator + validators)\n");
    MPI_Abort(MPI_COMM_WORLD, 1);
  }
  const int V = world - 1;
  const Role role = rank == 0 ? Role::Coordinator : Role::Validator;

  if (role == Role::Coordinator)
  {
    const RunConfig rc = run_config_from_env(/*parallel*/ false);
    std::fprintf(stderr, "[BOOT] world=%d, validators=%d\n", world, V);
    std::fflush(stderr);
    run_coordinator(rc, V);
  }
  else
  {
    run_validator(rank, ValidateConfig{}.fake_threshold);
  }

  MPI_Finalize();
  return 0;
}
