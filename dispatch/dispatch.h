// dispatch/dispatch.h
#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>
#include "common/book.h"
#include "common/schema.h"

enum class DispatchKey : uint8_t
{
  ReporterAndTimestamp = 0, // one dispatch per distinct report
  ReporterOnly = 1          // one dispatch per reporter per run
};

std::optional<DispatchKey> parse_dispatch_key(std::string_view s);

struct DispatchConfig
{
  DispatchKey key = DispatchKey::ReporterAndTimestamp;
  double min_score = 0.7;
};

// Keys already dispatched this run. insert() is atomic per key.
class DispatchLedger
{
public:
  // true iff the key was absent (and is now present)
  bool insert(const std::string &key);
  [[nodiscard]] bool contains(const std::string &key) const;
  [[nodiscard]] size_t size() const;

private:
  mutable std::mutex m_;
  std::unordered_set<std::string> keys_;
};

class Dispatcher
{
public:
  explicit Dispatcher(const DispatchConfig &c);

  [[nodiscard]] bool eligible(const IncidentReport &r) const;
  [[nodiscard]] std::string key_for(const IncidentReport &r) const;

  // true iff a new dispatch is issued for this report.
  bool maybe_dispatch(const IncidentReport &r, DispatchEvent *ev = nullptr);

  // Runs maybe_dispatch over the given reports, appending issued events.
  void sweep(const ReportBook &book, const std::vector<ReportIdx> &idxs, std::vector<DispatchEvent> &out);

  [[nodiscard]] uint64_t dispatched() const { return ledger_.size(); }
  [[nodiscard]] const DispatchLedger &ledger() const { return ledger_; }

private:
  DispatchConfig cfg_;
  DispatchLedger ledger_;
};
