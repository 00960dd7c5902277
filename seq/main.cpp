// seq/main.cpp

#include <vector>
#include <cstdio>
#include "common/env.h"
#include "common/timers.h"
#include "control/config.h"
#include "control/control.h"
#include "feed/feed.h"
#include "telemetry/telemetry.h"
#ifdef IVIRS_WITH_CLASSIFIER
#include "classify/classify.h"
#endif

namespace
{
  // Advisory classifier run alongside the rule-based verdicts; only built
  // when the OpenCL-capable classifier library is available.
  struct Advisory
  {
#ifdef IVIRS_WITH_CLASSIFIER
    Classifier cls{ClsConfig{.prefer_opencl = env_flag("IVIRS_OPENCL", true)}};
    std::vector<ClsFeatures> feats;
    std::vector<float> p_fake;
    std::vector<uint8_t> verdicts;
    unsigned long long scored = 0, agree = 0;

    void observe(const IncidentController &ctrl, const TickOutput &out)
    {
      feats.clear();
      verdicts.clear();
      for (const auto &e : out.validated)
      {
        const IncidentReport &r = ctrl.book().at(e.idx);
        const Rsu *n = r.rsu_id ? ctrl.router().node(*r.rsu_id) : nullptr;
        if (!n)
          continue;
        feats.push_back(make_features(e.in, distance(r.location, n->pos), n->radius, n->in_range.size()));
        verdicts.push_back(e.v.flagged);
      }
      cls.predict_batch(feats, p_fake);
      for (size_t i = 0; i < p_fake.size(); ++i)
      {
        ++scored;
        if ((p_fake[i] >= 0.5f) == (verdicts[i] != 0))
          ++agree;
      }
    }

    void summary() const
    {
      std::printf("classifier (%s) agreed with %llu of %llu verdicts\n",
                  cls.has_opencl() ? "OpenCL" : "CPU", agree, scored);
    }
#else
    void observe(const IncidentController &, const TickOutput &) {}
    void summary() const { std::printf("classifier not built\n"); }
#endif
  };
} // namespace

int main()
{
  const RunConfig rc = run_config_from_env(/*parallel*/ false);

  MobilityFeed feed(rc.feed);
  IncidentController ctrl(rc.ctrl);
  TelemetrySink sink(rc.telemetry);
  Advisory advisory;

  EntitySnapshot snap;
  TickOutput out;

  while (feed.next(snap))
  {
    auto t0 = now_ms();
    if (!ctrl.begin_tick(snap, out))
      break;
    auto t1 = now_ms();
    ctrl.validate_local(out);
    auto t2 = now_ms();
    ctrl.end_tick(out);
    auto t3 = now_ms();

    advisory.observe(ctrl, out);
    auto t4 = now_ms();

    publish(out, sink);

    if (out.stats)
      std::printf(
          "tick %5llu | hooks+route %3lldms | validate %3lldms | dispatch %3lldms | classify %3lldms | validated=%zu\n",
          (unsigned long long)out.tick,
          (long long)(t1 - t0), (long long)(t2 - t1),
          (long long)(t3 - t2), (long long)(t4 - t3),
          out.validated.size());
  }

  sink.write_reports(ctrl.book());
  sink.flush();
  print_summary(ctrl.counters(), sink.confusion());
  advisory.summary();
  return 0;
}
