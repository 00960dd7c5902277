// route/route.cpp
#include "route/route.h"
#include <limits>
#include "common/log.h"

CoverageRouter::CoverageRouter(const RouteConfig &c)
{
  nodes_.reserve(c.sites.size());
  for (size_t i = 0; i < c.sites.size(); ++i)
  {
    Rsu r;
    r.id = static_cast<RsuId>(i);
    r.pos = c.sites[i];
    r.radius = c.radius;
    nodes_.push_back(std::move(r));
  }
}

std::optional<RsuId> CoverageRouter::select(const Vec2 &p) const
{
  const Rsu *best = nullptr;
  double best_d = std::numeric_limits<double>::infinity();
  for (const auto &n : nodes_)
  {
    const double d = distance(p, n.pos);
    // nodes_ is in id order, so strict < keeps the lowest id on ties
    if (d < best_d)
    {
      best_d = d;
      best = &n;
    }
  }
  if (!best || best_d > best->radius)
    return std::nullopt;
  return best->id;
}

std::optional<RsuId> CoverageRouter::route(ReportBook &book, ReportIdx idx)
{
  IncidentReport &r = book.at(idx);
  auto id = select(r.location);
  if (!id)
  {
    ++dropped_;
    LOGD("[ROUTE] drop %s at (%.0f,%.0f): out of coverage", r.reporter.c_str(), r.location.x, r.location.y);
    return std::nullopt;
  }
  r.rsu_id = *id;
  nodes_[*id].queue.push_back(idx);
  ++total_;
  return id;
}

void CoverageRouter::update_coverage(const std::unordered_map<std::string, Vec2> &positions)
{
  for (auto &n : nodes_)
    n.in_range.clear();
  for (const auto &[vid, pos] : positions)
    for (auto &n : nodes_)
      if (distance(pos, n.pos) <= n.radius)
        n.in_range.insert(vid);
}

const Rsu *CoverageRouter::node(RsuId id) const
{
  return id < nodes_.size() ? &nodes_[id] : nullptr;
}
