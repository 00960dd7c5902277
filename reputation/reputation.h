// reputation/reputation.h
#pragma once
#include <algorithm>
#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

struct RepConfig
{
  double initial = 0.5; // assigned on first reference
  double reward = 0.1;  // accepted report
  double penalty = 0.3; // flagged report
};

// Vehicle id -> trust in [0,1]. Entries are created lazily and never removed,
// so reputation survives a vehicle leaving and re-entering the feed.
// Every read-modify-write of one id is serialized on that id's stripe lock;
// different ids on different stripes proceed in parallel.
class ReputationStore
{
public:
  explicit ReputationStore(const RepConfig &c = RepConfig{});

  // Current value; creates the entry at `initial` if absent.
  double get(const std::string &id);
  // Current value without creating an entry.
  [[nodiscard]] double peek(const std::string &id) const;

  // Atomic update: fn(current) -> next, result clamped to [0,1].
  template <typename Fn>
  double update(const std::string &id, Fn &&fn)
  {
    Stripe &s = stripe(id);
    std::lock_guard<std::mutex> g(s.m);
    auto it = s.map.try_emplace(id, cfg_.initial).first;
    it->second = std::clamp(static_cast<double>(fn(it->second)), 0.0, 1.0);
    return it->second;
  }

  // Applies the outcome of one validation and returns the new value.
  double record_outcome(const std::string &id, bool flagged);

  [[nodiscard]] size_t size() const;
  // Sorted by id.
  void snapshot(std::vector<std::pair<std::string, double>> &out) const;

  [[nodiscard]] const RepConfig &config() const { return cfg_; }

private:
  static constexpr size_t kStripes = 16;

  struct Stripe
  {
    mutable std::mutex m;
    std::unordered_map<std::string, double> map;
  };

  Stripe &stripe(const std::string &id) { return stripes_[std::hash<std::string>{}(id) % kStripes]; }
  const Stripe &stripe(const std::string &id) const { return stripes_[std::hash<std::string>{}(id) % kStripes]; }

  RepConfig cfg_;
  std::array<Stripe, kStripes> stripes_;
};
