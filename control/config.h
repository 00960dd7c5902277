// control/config.h
#pragma once
#include "control/control.h"
#include "feed/feed.h"
#include "telemetry/telemetry.h"

// Everything an executable needs to start a run.
struct RunConfig
{
  FeedConfig feed{};
  CtrlConfig ctrl{};
  TelemetryConfig telemetry{};
};

// Defaults overridden from the environment:
//   IVIRS_DURATION        simulated seconds (1000)
//   IVIRS_VEHICLES        active vehicles (200)
//   IVIRS_FAKE_RATIO      share of malicious vehicles (0.3)
//   IVIRS_SEED            feed / controller seed
//   IVIRS_OUT_DIR         output directory; unset => no files
//   IVIRS_STATS_INTERVAL  ticks between stats rows (100)
//   IVIRS_DISPATCH_KEY    reporter_timestamp | reporter
//   IVIRS_PARALLEL        validate RSUs concurrently (0/1)
RunConfig run_config_from_env(bool parallel_default);
