#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace proctally::util {

// "30s", "15m", "2h", "7d", "1.5h" (unit case-insensitive) -> seconds
[[nodiscard]] auto parse_duration(std::string_view spec) -> std::optional<double>;

// "now", a duration meaning now-minus-duration, epoch seconds, or local
// "YYYY-MM-DDTHH:MM:SS" / "YYYY-MM-DD HH:MM:SS" / "YYYY-MM-DD".
[[nodiscard]] auto parse_time_point(std::string_view spec, double now_ts) -> std::optional<double>;

struct TimeWindow {
  double since{};
  double until{};
};

// Resolve --since/--until into [since, until). Throws std::invalid_argument
// naming the offending argument and an accepted example.
[[nodiscard]] auto resolve_window(const std::string& since_spec, const std::string& until_spec,
                                  double now_ts) -> TimeWindow;

// Duration argument with the same error convention as resolve_window.
[[nodiscard]] auto require_duration(const char* arg_name, const std::string& spec) -> double;

// Current wall-clock time as fractional epoch seconds.
[[nodiscard]] double wall_now();

} // namespace proctally::util
