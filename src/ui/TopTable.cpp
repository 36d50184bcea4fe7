#include "ui/TopTable.hpp"
#include "ui/Formatting.hpp"
#include <cstdio>

namespace proctally::ui {

namespace {
constexpr int kLabelW = 48;
constexpr int kCpuW = 12;
constexpr int kEffW = 9;
constexpr int kPctW = 9;
constexpr int kActiveW = 10;
constexpr int kSamplesW = 8;

std::string fmt(const char* f, double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), f, v);
  return buf;
}
}

std::string row_label(const proctally::store::AggregateRow& r, proctally::store::GroupBy group) {
  if (group == proctally::store::GroupBy::Session) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%d@%.2f", r.pid.value_or(0), r.create_time.value_or(0.0));
    return buf;
  }
  return r.exe_path;
}

std::string render_top_table(const std::vector<proctally::store::AggregateRow>& rows,
                             proctally::store::GroupBy group) {
  std::string out;
  const char* label = group == proctally::store::GroupBy::Session ? "pid@ctime" : "exe_or_name";
  out += trunc_pad(label, kLabelW) + " " + rpad_trunc("cpu_s", kCpuW) + " " + rpad_trunc("avg_eff", kEffW) + " "
       + rpad_trunc("avg_cpu%", kPctW) + " " + rpad_trunc("active_s", kActiveW) + " "
       + rpad_trunc("samples", kSamplesW) + "\n";
  out += std::string(kLabelW + kCpuW + kEffW + kPctW + kActiveW + kSamplesW + 5, '-') + "\n";
  for (const auto& r : rows) {
    out += trunc_pad_left(row_label(r, group), kLabelW) + " ";
    out += rpad_trunc(fmt("%.2f", r.cpu_s), kCpuW) + " ";
    out += rpad_trunc(fmt("%.3f", r.avg_eff_cores), kEffW) + " ";
    out += rpad_trunc(fmt("%.1f", r.avg_cpu_percent), kPctW) + " ";
    out += rpad_trunc(fmt("%.1f", r.active_wall_s), kActiveW) + " ";
    out += rpad_trunc(std::to_string(r.samples), kSamplesW) + "\n";
  }
  return out;
}

} // namespace proctally::ui
