// reputation/reputation.cpp
#include "reputation/reputation.h"

ReputationStore::ReputationStore(const RepConfig &c) : cfg_(c) {}

double ReputationStore::get(const std::string &id)
{
  Stripe &s = stripe(id);
  std::lock_guard<std::mutex> g(s.m);
  return s.map.try_emplace(id, cfg_.initial).first->second;
}

double ReputationStore::peek(const std::string &id) const
{
  const Stripe &s = stripe(id);
  std::lock_guard<std::mutex> g(s.m);
  auto it = s.map.find(id);
  return it == s.map.end() ? cfg_.initial : it->second;
}

double ReputationStore::record_outcome(const std::string &id, bool flagged)
{
  const double delta = flagged ? -cfg_.penalty : cfg_.reward;
  return update(id, [delta](double cur)
                { return cur + delta; });
}

size_t ReputationStore::size() const
{
  size_t n = 0;
  for (const auto &s : stripes_)
  {
    std::lock_guard<std::mutex> g(s.m);
    n += s.map.size();
  }
  return n;
}

void ReputationStore::snapshot(std::vector<std::pair<std::string, double>> &out) const
{
  out.clear();
  for (const auto &s : stripes_)
  {
    std::lock_guard<std::mutex> g(s.m);
    out.insert(out.end(), s.map.begin(), s.map.end());
  }
  std::sort(out.begin(), out.end());
}
