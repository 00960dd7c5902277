// telemetry/records.cpp
#include "telemetry/records.h"
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <utility>
#include <vector>

namespace
{
  void put_f64(std::string &s, double v)
  {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    s += buf;
  }

  void put_u64(std::string &s, uint64_t v)
  {
    s += std::to_string(v);
  }

  // Vehicle ids are opaque: separators, line breaks, '%' and a bare "-"
  // are percent-encoded so every id reads back unchanged.
  void put_id(std::string &s, const std::string &id)
  {
    static constexpr char kHex[] = "0123456789ABCDEF";
    if (id == "-")
    {
      s += "%2D";
      return;
    }
    for (char c : id)
    {
      if (c == '%' || c == '\t' || c == ',' || c == '\n' || c == '\r')
      {
        const auto u = static_cast<unsigned char>(c);
        s += '%';
        s += kHex[u >> 4];
        s += kHex[u & 0xF];
      }
      else
      {
        s += c;
      }
    }
  }

  int hex_digit(char c)
  {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    return -1;
  }

  std::optional<std::string> get_id(std::string_view sv)
  {
    if (sv.empty())
      return std::nullopt;
    std::string out;
    out.reserve(sv.size());
    for (size_t i = 0; i < sv.size(); ++i)
    {
      if (sv[i] != '%')
      {
        out += sv[i];
        continue;
      }
      if (i + 2 >= sv.size())
        return std::nullopt;
      const int hi = hex_digit(sv[i + 1]);
      const int lo = hex_digit(sv[i + 2]);
      if (hi < 0 || lo < 0)
        return std::nullopt;
      out += static_cast<char>(hi * 16 + lo);
      i += 2;
    }
    return out;
  }

  std::vector<std::string_view> split(std::string_view line, char sep)
  {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
      line.remove_suffix(1);
    std::vector<std::string_view> out;
    size_t start = 0;
    for (;;)
    {
      size_t p = line.find(sep, start);
      if (p == std::string_view::npos)
      {
        out.push_back(line.substr(start));
        return out;
      }
      out.push_back(line.substr(start, p - start));
      start = p + 1;
    }
  }

  std::optional<double> get_f64(std::string_view sv)
  {
    if (sv.empty())
      return std::nullopt;
    std::string s(sv);
    char *end = nullptr;
    errno = 0;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || errno == ERANGE || std::isnan(v))
      return std::nullopt;
    return v;
  }

  std::optional<uint64_t> get_u64(std::string_view sv)
  {
    if (sv.empty() || sv.front() == '-')
      return std::nullopt;
    std::string s(sv);
    char *end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (end != s.c_str() + s.size() || errno == ERANGE)
      return std::nullopt;
    return static_cast<uint64_t>(v);
  }

  std::optional<bool> get_bool(std::string_view sv)
  {
    if (sv == "1")
      return true;
    if (sv == "0")
      return false;
    return std::nullopt;
  }
} // namespace

std::string format_report(const IncidentReport &r)
{
  std::string s = REC_REPORT;
  s += '\t';
  put_id(s, r.reporter);
  s += '\t';
  s += to_string(r.type);
  s += '\t';
  put_f64(s, r.location.x);
  s += '\t';
  put_f64(s, r.location.y);
  s += '\t';
  put_f64(s, r.timestamp);
  s += r.is_fake ? "\t1\t" : "\t0\t";
  if (r.witnesses.empty())
  {
    s += '-';
  }
  else
  {
    for (size_t i = 0; i < r.witnesses.size(); ++i)
    {
      if (i)
        s += ',';
      put_id(s, r.witnesses[i]);
    }
  }
  s += '\t';
  if (r.rsu_id)
    put_u64(s, *r.rsu_id);
  else
    s += '-';
  s += r.validated() ? "\t1\t" : "\t0\t";
  put_f64(s, r.trust_score);
  return s;
}

std::string format_stats(const StatsRow &st)
{
  std::string s = REC_STATS;
  s += '\t';
  put_f64(s, st.timestamp);
  s += '\t';
  put_u64(s, st.active_vehicles);
  s += '\t';
  put_u64(s, st.total_reports);
  s += '\t';
  put_u64(s, st.fake_reports);
  s += '\t';
  put_u64(s, st.detected_fakes);
  s += '\t';
  put_f64(s, st.detection_accuracy);
  return s;
}

std::string format_dispatch(const DispatchEvent &d)
{
  std::string s = REC_DISPATCH;
  s += '\t';
  put_id(s, d.reporter);
  s += '\t';
  put_f64(s, d.timestamp);
  s += '\t';
  put_f64(s, d.location.x);
  s += '\t';
  put_f64(s, d.location.y);
  return s;
}

std::optional<IncidentReport> parse_report(std::string_view line)
{
  const auto f = split(line, '\t');
  if (f.size() != 11 || f[0] != REC_REPORT)
    return std::nullopt;

  IncidentReport r;
  auto reporter = get_id(f[1]);
  auto type = parse_report_type(f[2]);
  auto x = get_f64(f[3]);
  auto y = get_f64(f[4]);
  auto ts = get_f64(f[5]);
  auto fake = get_bool(f[6]);
  auto validated = get_bool(f[9]);
  auto trust = get_f64(f[10]);
  if (!reporter || !type || !x || !y || !ts || !fake || !validated || !trust)
    return std::nullopt;

  r.reporter = std::move(*reporter);
  r.type = *type;
  r.location = Vec2{*x, *y};
  r.timestamp = *ts;
  r.is_fake = *fake;
  r.status = *validated ? ReportStatus::Validated : ReportStatus::Pending;
  r.trust_score = *trust;

  if (f[7] != "-")
  {
    for (auto w : split(f[7], ','))
    {
      auto id = get_id(w);
      if (!id)
        return std::nullopt;
      r.witnesses.push_back(std::move(*id));
    }
  }

  if (f[8] != "-")
  {
    auto rsu = get_u64(f[8]);
    if (!rsu || *rsu > UINT16_MAX)
      return std::nullopt;
    r.rsu_id = static_cast<RsuId>(*rsu);
  }
  return r;
}

std::optional<StatsRow> parse_stats(std::string_view line)
{
  const auto f = split(line, '\t');
  if (f.size() != 7 || f[0] != REC_STATS)
    return std::nullopt;

  auto ts = get_f64(f[1]);
  auto active = get_u64(f[2]);
  auto total = get_u64(f[3]);
  auto fakes = get_u64(f[4]);
  auto detected = get_u64(f[5]);
  auto acc = get_f64(f[6]);
  if (!ts || !active || !total || !fakes || !detected || !acc || *active > UINT32_MAX)
    return std::nullopt;

  StatsRow s;
  s.timestamp = *ts;
  s.active_vehicles = static_cast<uint32_t>(*active);
  s.total_reports = *total;
  s.fake_reports = *fakes;
  s.detected_fakes = *detected;
  s.detection_accuracy = *acc;
  return s;
}

std::optional<DispatchEvent> parse_dispatch(std::string_view line)
{
  const auto f = split(line, '\t');
  if (f.size() != 5 || f[0] != REC_DISPATCH)
    return std::nullopt;

  auto reporter = get_id(f[1]);
  auto ts = get_f64(f[2]);
  auto x = get_f64(f[3]);
  auto y = get_f64(f[4]);
  if (!reporter || !ts || !x || !y)
    return std::nullopt;
  return DispatchEvent{std::move(*reporter), *ts, Vec2{*x, *y}};
}
