#include "app/CsvExport.hpp"
#include "util/Log.hpp"
#include <cerrno>
#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <stdexcept>

namespace proctally::app {

std::string csv_field(const std::string& s) {
  if (s.find_first_of(",\"\r\n") == std::string::npos) return s;
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string csv_header(proctally::store::GroupBy group) {
  const char* tail = "samples,cpu_s,wall_s,active_wall_s,avg_eff_cores,avg_cpu_percent,avg_rss,since_ts,until_ts";
  if (group == proctally::store::GroupBy::Session) return std::string("pid,create_time,exe_path,") + tail;
  return std::string("exe_path,") + tail;
}

namespace {
struct FileCloser { void operator()(std::FILE* f) const { if (f) std::fclose(f); } };
}

size_t write_csv(const std::string& path,
                 const std::vector<proctally::store::AggregateRow>& rows,
                 proctally::store::GroupBy group,
                 const proctally::util::TimeWindow& window) {
  namespace fs = std::filesystem;
  fs::path p(path);
  if (p.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
    if (ec) throw std::runtime_error("cannot create directory " + p.parent_path().string() + ": " + ec.message());
  }
  std::unique_ptr<std::FILE, FileCloser> f(std::fopen(path.c_str(), "w"));
  if (!f) throw std::runtime_error("cannot open " + path + ": " + std::strerror(errno));

  std::fprintf(f.get(), "%s\n", csv_header(group).c_str());
  for (const auto& r : rows) {
    if (group == proctally::store::GroupBy::Session) {
      std::fprintf(f.get(), "%d,%.6f,", r.pid.value_or(0), r.create_time.value_or(0.0));
    }
    std::string rss;
    if (r.avg_rss) rss = std::to_string(static_cast<int64_t>(std::llround(*r.avg_rss)));
    std::fprintf(f.get(), "%s,%" PRId64 ",%.6f,%.6f,%.6f,%.6f,%.6f,%s,%.6f,%.6f\n",
                 csv_field(r.exe_path).c_str(), r.samples, r.cpu_s, r.wall_s, r.active_wall_s,
                 r.avg_eff_cores, r.avg_cpu_percent, rss.c_str(), window.since, window.until);
  }
  if (std::fflush(f.get()) != 0 || std::ferror(f.get())) {
    throw std::runtime_error("write failed for " + path + ": " + std::strerror(errno));
  }
  proctally::util::log_debug("export", "%zu rows -> %s", rows.size(), path.c_str());
  return rows.size();
}

} // namespace proctally::app
