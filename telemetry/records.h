// telemetry/records.h
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "common/schema.h"

// Line records for downstream report generation. One record per line,
// tab-separated, first field is the record tag with its schema version.
// Doubles are written with 17 significant digits so parsing is exact.
// Vehicle ids are written percent-encoded ('%', tab, comma, CR, LF, and an
// id that is exactly "-"), so any id parses back unchanged.
//
//   report.v1   reporter type x y timestamp is_fake witnesses rsu validated trust_score
//   stats.v1    timestamp active_vehicles total_reports fake_reports detected_fakes detection_accuracy
//   dispatch.v1 reporter timestamp x y
//
// Empty witness lists and a missing rsu are written as "-".

inline constexpr const char *REC_REPORT = "report.v1";
inline constexpr const char *REC_STATS = "stats.v1";
inline constexpr const char *REC_DISPATCH = "dispatch.v1";

std::string format_report(const IncidentReport &r);
std::string format_stats(const StatsRow &s);
std::string format_dispatch(const DispatchEvent &d);

// nullopt on a wrong tag, wrong field count or an unparseable field.
std::optional<IncidentReport> parse_report(std::string_view line);
std::optional<StatsRow> parse_stats(std::string_view line);
std::optional<DispatchEvent> parse_dispatch(std::string_view line);
