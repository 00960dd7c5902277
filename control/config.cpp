// control/config.cpp
#include "control/config.h"
#include "common/env.h"
#include "common/log.h"

RunConfig run_config_from_env(bool parallel_default)
{
  RunConfig rc;
  const double duration = env_f64("IVIRS_DURATION", 1000.0, 1.0, 1e7);
  const uint32_t seed = env_u32("IVIRS_SEED", 12345);

  rc.feed.vehicles = env_u32("IVIRS_VEHICLES", 200);
  rc.feed.duration_s = duration;
  rc.feed.fake_ratio = env_f64("IVIRS_FAKE_RATIO", 0.3, 0.0, 1.0);
  rc.feed.seed = seed;

  rc.ctrl.sim_seconds = duration;
  rc.ctrl.seed = seed ^ 0x9e3779b9u;
  rc.ctrl.stats_interval = env_u32("IVIRS_STATS_INTERVAL", 100);
  rc.ctrl.validate.parallel = env_flag("IVIRS_PARALLEL", parallel_default);

  const std::string key = env_str("IVIRS_DISPATCH_KEY", "reporter_timestamp");
  if (auto k = parse_dispatch_key(key))
    rc.ctrl.dispatch.key = *k;
  else
    LOG("[CONFIG] unknown IVIRS_DISPATCH_KEY '%s', using reporter_timestamp", key.c_str());

  rc.telemetry.out_dir = env_str("IVIRS_OUT_DIR", "");

  LOG("[CONFIG] duration=%.0fs vehicles=%u fake_ratio=%.2f seed=%u parallel=%d out=%s",
      duration, rc.feed.vehicles, rc.feed.fake_ratio, seed, rc.ctrl.validate.parallel ? 1 : 0,
      rc.telemetry.out_dir.empty() ? "-" : rc.telemetry.out_dir.c_str());
  return rc;
}
