// common/schema.h
#pragma once
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using RsuId = uint16_t;
using ReportIdx = uint32_t;

struct Vec2
{
  double x{0.0};
  double y{0.0};
};

[[nodiscard]] inline double distance(const Vec2 &a, const Vec2 &b)
{
  return std::hypot(a.x - b.x, a.y - b.y);
}

// Resolved once per vehicle lifetime (see VehicleRegistry).
enum class VehicleRole : uint8_t
{
  Unclassified = 0,
  Honest = 1,
  Malicious = 2,
  Emergency = 3
};

// Raw role flags as delivered by the mobility feed.
enum RoleFlag : uint8_t
{
  ROLE_NONE = 0,
  ROLE_HONEST = 1 << 0,
  ROLE_MALICIOUS = 1 << 1,
  ROLE_EMERGENCY = 1 << 2
};

enum class ReportType : uint8_t
{
  Accident = 0,
  Breakdown = 1,
  Hazard = 2
};

inline const char *to_string(ReportType t)
{
  switch (t)
  {
  case ReportType::Accident:
    return "accident";
  case ReportType::Breakdown:
    return "breakdown";
  case ReportType::Hazard:
    return "hazard";
  }
  return "hazard";
}

inline std::optional<ReportType> parse_report_type(std::string_view s)
{
  if (s == "accident")
    return ReportType::Accident;
  if (s == "breakdown")
    return ReportType::Breakdown;
  if (s == "hazard")
    return ReportType::Hazard;
  return std::nullopt;
}

enum class ReportStatus : uint8_t
{
  Pending = 0,
  Validated = 1
};

struct IncidentReport
{
  std::string reporter;
  ReportType type{ReportType::Hazard};
  Vec2 location;
  double timestamp{0.0};
  bool is_fake{false}; // ground truth, evaluation only
  std::vector<std::string> witnesses;
  std::optional<RsuId> rsu_id;
  ReportStatus status{ReportStatus::Pending};
  double trust_score{0.5};

  [[nodiscard]] bool validated() const { return status == ReportStatus::Validated; }
};

// Timer fields are kept as raw strings; the registry parses them.
struct TimerParam
{
  std::string key;
  std::string value;
};

struct VehicleRecord
{
  std::string id;
  Vec2 pos;
  uint8_t role_flags{ROLE_NONE};
  std::vector<TimerParam> timers;
};

struct EntitySnapshot
{
  uint64_t tick{0};
  double time{0.0};
  std::vector<VehicleRecord> vehicles;
};

struct StatsRow
{
  double timestamp{0.0};
  uint32_t active_vehicles{0};
  uint64_t total_reports{0};
  uint64_t fake_reports{0};
  uint64_t detected_fakes{0};
  double detection_accuracy{0.0};
};

struct DispatchEvent
{
  std::string reporter;
  double timestamp{0.0};
  Vec2 location;
};

// ScoreInput / Verdict: compact, POD, suitable for MPI raw sends.
struct ScoreInput
{
  double reputation;
  double reporter_distance; // valid only when has_position != 0
  uint32_t witnesses;
  uint8_t has_position;
};

struct Verdict
{
  double score;
  uint8_t flagged;
};

struct ScoreJob
{
  ReportIdx idx;
  ScoreInput in;
};

// The input is echoed back so the owner can tell whether the reputation it
// was scored against is still current.
struct ScoreResult
{
  ReportIdx idx;
  ScoreInput in;
  Verdict v;
};

static_assert(sizeof(ScoreInput) >= 8 + 8 + 4 + 1, "ScoreInput unexpectedly small");
static_assert(sizeof(ScoreJob) >= sizeof(ReportIdx) + sizeof(ScoreInput), "ScoreJob size mismatch");
static_assert(sizeof(ScoreResult) >= sizeof(ReportIdx) + sizeof(ScoreInput) + sizeof(Verdict), "ScoreResult size mismatch");
