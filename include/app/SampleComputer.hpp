#pragma once
#include "model/Process.hpp"
#include <optional>

namespace proctally::app {

// Equivalent-core ceiling as a multiple of the logical core count.
// Anything above it is a counter wrap or clock skew artifact.
inline constexpr double kMaxCoresFactor = 1.5;
inline constexpr double kDefaultActiveThreshold = 0.005;

struct SampleParams {
  unsigned logical_cores{1};
  double active_threshold{kDefaultActiveThreshold};
};

[[nodiscard]] double equivalent_cores(double delta_cpu_s, double dt_s, unsigned logical_cores);
[[nodiscard]] inline bool is_active(double eff_cores, double threshold) { return eff_cores >= threshold; }

// Build the Sample for one session. No Sample when the CPU counters were
// unreadable this tick or dt_s is not positive.
[[nodiscard]] std::optional<proctally::model::Sample>
compute_sample(const proctally::model::ProcReading& r, double ts, double dt_s, double delta_cpu_s,
               const SampleParams& params);

} // namespace proctally::app
