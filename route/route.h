// route/route.h
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "common/book.h"
#include "common/schema.h"

struct Rsu
{
  RsuId id{0};
  Vec2 pos;
  double radius{500.0};
  std::vector<ReportIdx> queue;             // received, not yet validated
  std::unordered_set<std::string> in_range; // rebuilt every tick
};

struct RouteConfig
{
  // Highway deployment: one RSU every 2 km, 50 m off the carriageway.
  std::vector<Vec2> sites{{0, -50}, {2000, -50}, {4000, -50}, {6000, -50}, {8000, -50}, {10000, -50}};
  double radius{500.0};
};

class CoverageRouter
{
public:
  explicit CoverageRouter(const RouteConfig &c);

  // Nearest node (lowest id on ties) if its radius contains p.
  [[nodiscard]] std::optional<RsuId> select(const Vec2 &p) const;

  // Assigns the report to the selected node's queue, or drops it.
  std::optional<RsuId> route(ReportBook &book, ReportIdx idx);

  void update_coverage(const std::unordered_map<std::string, Vec2> &positions);

  std::vector<Rsu> &nodes() { return nodes_; }
  [[nodiscard]] const std::vector<Rsu> &nodes() const { return nodes_; }
  [[nodiscard]] const Rsu *node(RsuId id) const;

  [[nodiscard]] uint64_t total_reports() const { return total_; }
  [[nodiscard]] uint64_t dropped_reports() const { return dropped_; }

private:
  std::vector<Rsu> nodes_;
  uint64_t total_{0};
  uint64_t dropped_{0};
};
