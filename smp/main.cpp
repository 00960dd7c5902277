// smp/main.cpp

#include <thread>
#include <atomic>
#include <vector>
#include <cstdio>
#include "common/env.h"
#include "common/ring.h"
#include "common/timers.h"
#include "control/config.h"
#include "control/control.h"
#include "feed/feed.h"
#include "telemetry/telemetry.h"

// Three threads: feed -> pipeline -> sink, joined by SPSC rings. Validation
// inside the pipeline thread runs RSU queues in parallel (OpenMP).
int main()
{
  const RunConfig rc = run_config_from_env(/*parallel*/ true);
  const uint32_t pace_ms = env_u32("IVIRS_PACE_MS", 0); // 0 = as fast as possible

  MobilityFeed feed(rc.feed);
  IncidentController ctrl(rc.ctrl);
  TelemetrySink sink(rc.telemetry);

  SpscRing<EntitySnapshot> ringFP(64);
  SpscRing<TickOutput> ringPS(256);

  std::atomic<bool> stop{false};

  std::thread thF([&]
                  {
    EntitySnapshot s;
    const uint64_t first = now_ms();
    uint64_t n = 0;
    while (!stop.load() && feed.next(s)) {
      if (pace_ms > 0)
        sleep_until_ms(first + n * pace_ms);
      ringFP.push_wait(std::move(s));
      ++n;
    }
    ringFP.close(); });

  std::thread thP([&]
                  {
    while (auto s = ringFP.pop_wait()) {
      TickOutput out;
      auto t0 = now_ms();
      if (!ctrl.step(*s, out)) {
        stop.store(true);
        break;
      }
      if (out.stats)
        std::printf("tick %5llu | validated=%zu dispatched=%zu | FP:%zu PS:%zu | lat=%lldms\n",
                    (unsigned long long)out.tick, out.validated.size(), out.dispatches.size(),
                    ringFP.size(), ringPS.size(), (long long)(now_ms() - t0));
      ringPS.push_wait(std::move(out));
    }
    stop.store(true);
    ringPS.close();
    // let the feed thread leave push_wait()
    while (ringFP.pop()) {} });

  std::thread thS([&]
                  {
    while (auto o = ringPS.pop_wait())
      publish(*o, sink);
    sink.flush(); });

  thP.join();
  thF.join();
  thS.join();

  sink.write_reports(ctrl.book());
  print_summary(ctrl.counters(), sink.confusion());
  return 0;
}
