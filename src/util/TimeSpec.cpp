#include "util/TimeSpec.hpp"

#include <cctype>
#include <charconv>
#include <chrono>
#include <cstring>
#include <ctime>
#include <stdexcept>

namespace proctally::util {

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

// Plain non-negative decimal: digits with at most one '.', no sign or exponent.
static bool is_plain_decimal(std::string_view sv) {
  if (sv.empty()) return false;
  bool dot = false, digit = false;
  for (char c : sv) {
    if (c == '.') { if (dot) return false; dot = true; }
    else if (c >= '0' && c <= '9') digit = true;
    else return false;
  }
  return digit;
}

static std::optional<double> to_double(std::string_view sv) {
  double v = 0.0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
  return v;
}

auto parse_duration(std::string_view spec) -> std::optional<double> {
  auto sv = trim(spec);
  if (sv.size() < 2) return std::nullopt;
  char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(sv.back())));
  auto num = trim(sv.substr(0, sv.size() - 1));
  if (!is_plain_decimal(num)) return std::nullopt;
  auto v = to_double(num);
  if (!v) return std::nullopt;
  switch (unit) {
    case 's': return *v;
    case 'm': return *v * 60.0;
    case 'h': return *v * 3600.0;
    case 'd': return *v * 86400.0;
    default: return std::nullopt;
  }
}

static std::optional<double> parse_local_datetime(const std::string& s) {
  static const char* formats[] = {"%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M:%S", "%Y-%m-%d"};
  for (const char* fmt : formats) {
    std::tm tm{};
    const char* end = ::strptime(s.c_str(), fmt, &tm);
    if (!end || *end != '\0') continue;
    tm.tm_isdst = -1; // let mktime decide for local time
    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) continue;
    return static_cast<double>(t);
  }
  return std::nullopt;
}

auto parse_time_point(std::string_view spec, double now_ts) -> std::optional<double> {
  auto sv = trim(spec);
  if (sv.empty()) return std::nullopt;
  std::string lower(sv);
  for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (lower == "now") return now_ts;
  if (auto d = parse_duration(sv)) return now_ts - *d;
  if (is_plain_decimal(sv)) return to_double(sv);
  return parse_local_datetime(std::string(sv));
}

auto resolve_window(const std::string& since_spec, const std::string& until_spec,
                    double now_ts) -> TimeWindow {
  TimeWindow w;
  auto since = since_spec.empty() ? std::optional<double>(now_ts - 86400.0) : parse_time_point(since_spec, now_ts);
  if (!since) {
    throw std::invalid_argument("invalid --since '" + since_spec +
                                "' (examples: 24h, now, 1725280200, 2025-09-02T12:30:00)");
  }
  auto until = until_spec.empty() ? std::optional<double>(now_ts) : parse_time_point(until_spec, now_ts);
  if (!until) {
    throw std::invalid_argument("invalid --until '" + until_spec +
                                "' (examples: now, 1h, 1725283800, 2025-09-02 13:30:00)");
  }
  if (*until < *since) {
    throw std::invalid_argument("--until must not be earlier than --since (example: --since 2h --until now)");
  }
  w.since = *since;
  w.until = *until;
  return w;
}

auto require_duration(const char* arg_name, const std::string& spec) -> double {
  auto d = parse_duration(spec);
  if (!d) {
    throw std::invalid_argument(std::string("invalid ") + arg_name + " '" + spec +
                                "' (examples: 30s, 10m, 2h, 7d)");
  }
  return *d;
}

double wall_now() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

} // namespace proctally::util
