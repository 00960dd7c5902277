// classify/classify.h
#pragma once
#include <memory>
#include <vector>
#include "common/schema.h"

constexpr int CLS_FEATURES = 6;

// f0 reputation, f1 witness count (capped at 4), f2 location credibility
// 1/(1+d/100) (0.5 when unknown), f3 RSU distance / radius, f4 witnesses per
// vehicle in RSU range, f5 reporter position known.
struct ClsFeatures
{
  float f[CLS_FEATURES];
};

ClsFeatures make_features(const ScoreInput &in, double rsu_distance, double rsu_radius, size_t in_range);

struct ClsConfig
{
  bool prefer_opencl = true;
};

// Advisory fake-report probability from the exported offline model. Its
// output is compared against the rule-based verdict, never substituted.
class Classifier
{
public:
  explicit Classifier(const ClsConfig &c);
  ~Classifier();
  Classifier(const Classifier &) = delete;
  Classifier &operator=(const Classifier &) = delete;

  bool has_opencl() const { return cl_ != nullptr; }

  // P(fake) in [0,1] per row. Runs on the device when one was set up and
  // falls back to the CPU for the whole batch if any device step fails.
  void predict_batch(const std::vector<ClsFeatures> &feats, std::vector<float> &out);

private:
  struct ClCtx;

  ClsConfig cfg_;
  std::unique_ptr<ClCtx> cl_;

  void init_opencl_if_possible();
  void cpu_predict(const std::vector<ClsFeatures> &feats, std::vector<float> &out);
  bool run_device(const std::vector<ClsFeatures> &feats, std::vector<float> &out);
};
