// feed/feed.h
#pragma once
#include <cstdint>
#include <random>
#include <string>
#include <vector>
#include "common/schema.h"
#include "common/timers.h"

// Synthetic stand-in for the external mobility feed: a straight multi-lane
// highway with vehicles entering at x=0 and leaving past road_length.
struct FeedConfig
{
  uint32_t vehicles{200}; // active population, kept constant
  double duration_s{1000.0};
  double step_s{1.0};
  double road_length{10000.0};
  double half_width{50.0};
  double fake_ratio{0.3};      // share of malicious vehicles
  double honest_ratio{0.6};    // share of honest reporters among the rest
  double emergency_ratio{0.02};
  double incident_ratio{0.05}; // vehicles carrying a breakdown or crash timer
  double malformed_ratio{0.01};
  uint32_t seed{12345};
};

class MobilityFeed
{
public:
  explicit MobilityFeed(const FeedConfig &cfg);
  // Fills the next snapshot; false once duration_s has elapsed.
  bool next(EntitySnapshot &out);

  [[nodiscard]] uint64_t spawned() const { return next_id_; }

private:
  struct SimVehicle
  {
    VehicleRecord rec;
    double speed{25.0};
  };

  SimVehicle spawn(double t, double x);
  std::string timer_value(double due);

  FeedConfig cfg_;
  std::mt19937 rng_;
  std::vector<SimVehicle> fleet_;
  SimClock clock_;
  uint64_t next_id_{0};
};
