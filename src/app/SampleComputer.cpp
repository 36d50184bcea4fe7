#include "app/SampleComputer.hpp"
#include "util/Log.hpp"
#include <algorithm>

namespace proctally::app {

double equivalent_cores(double delta_cpu_s, double dt_s, unsigned logical_cores) {
  if (dt_s <= 0.0) return 0.0;
  double cap = kMaxCoresFactor * static_cast<double>(std::max(1u, logical_cores));
  return std::min(delta_cpu_s / dt_s, cap);
}

std::optional<proctally::model::Sample>
compute_sample(const proctally::model::ProcReading& r, double ts, double dt_s, double delta_cpu_s,
               const SampleParams& params) {
  if (!r.cpu_time_s) {
    proctally::util::log_debug("sample", "pid %d: cpu counters unreadable, no sample", r.key.pid);
    return std::nullopt;
  }
  if (!(dt_s > 0.0)) {
    proctally::util::log_debug("sample", "pid %d: non-positive dt %.6f, no sample", r.key.pid, dt_s);
    return std::nullopt;
  }
  proctally::model::Sample s;
  s.ts = ts;
  s.key = r.key;
  s.dt_s = dt_s;
  s.delta_cpu_s = delta_cpu_s;
  s.eff_cores = equivalent_cores(delta_cpu_s, dt_s, params.logical_cores);
  s.active = is_active(s.eff_cores, params.active_threshold);
  s.rss_bytes = r.rss_bytes;
  s.vms_bytes = r.vms_bytes;
  s.io_read_bytes = r.io_read_bytes;
  s.io_write_bytes = r.io_write_bytes;
  return s;
}

} // namespace proctally::app
