#include "store/Aggregator.hpp"
#include <stdexcept>

namespace proctally::store {

static const char* kByExecutableSql = R"SQL(
SELECT
  COALESCE(p.exe_path, p.name, '<unknown>') AS grp,
  COUNT(*),
  SUM(s.delta_cpu_s),
  SUM(s.dt_s),
  SUM(CASE WHEN s.active = 1 THEN s.dt_s ELSE 0 END),
  AVG(s.rss_bytes)
FROM sample s
JOIN process p ON p.id = s.process_id
WHERE s.ts >= ?1 AND s.ts < ?2
GROUP BY grp
ORDER BY 3 DESC, grp ASC
LIMIT ?3
)SQL";

static const char* kBySessionSql = R"SQL(
SELECT
  p.pid,
  p.create_time,
  COALESCE(p.exe_path, p.name, '<unknown>'),
  COUNT(*),
  SUM(s.delta_cpu_s),
  SUM(s.dt_s),
  SUM(CASE WHEN s.active = 1 THEN s.dt_s ELSE 0 END),
  AVG(s.rss_bytes)
FROM sample s
JOIN process p ON p.id = s.process_id
WHERE s.ts >= ?1 AND s.ts < ?2
GROUP BY p.id
ORDER BY 5 DESC, p.pid ASC, p.create_time ASC
LIMIT ?3
)SQL";

std::optional<GroupBy> parse_group(std::string_view s) {
  if (s == "exe" || s == "by-executable") return GroupBy::Executable;
  if (s == "pid" || s == "by-session") return GroupBy::Session;
  return std::nullopt;
}

GroupBy require_group(const std::string& s) {
  auto g = parse_group(s);
  if (!g) throw std::invalid_argument("invalid --group '" + s + "' (expected: exe or pid, e.g. --group exe)");
  return *g;
}

static void finish_row(AggregateRow& r) {
  r.avg_eff_cores = r.wall_s > 0.0 ? r.cpu_s / r.wall_s : 0.0;
  r.avg_cpu_percent = r.avg_eff_cores * 100.0;
}

std::vector<AggregateRow> Aggregator::aggregate(const AggregateQuery& q) {
  if (q.window.until < q.window.since) {
    throw std::invalid_argument("window until must not be earlier than since");
  }
  if (q.limit && *q.limit < 1) {
    throw std::invalid_argument("invalid --limit " + std::to_string(*q.limit) + " (must be >= 1, e.g. --limit 20)");
  }
  bool by_session = q.group == GroupBy::Session;
  auto st = db_.prepare(by_session ? kBySessionSql : kByExecutableSql);
  st.bind(1, q.window.since).bind(2, q.window.until).bind(3, q.limit ? *q.limit : -1);

  std::vector<AggregateRow> rows;
  while (st.step()) {
    AggregateRow r;
    int c = 0;
    if (by_session) {
      r.pid = static_cast<int32_t>(st.column_int64(c++));
      r.create_time = st.column_double(c++);
    }
    r.exe_path = st.column_text(c++);
    r.samples = st.column_int64(c++);
    r.cpu_s = st.column_double(c++);
    r.wall_s = st.column_double(c++);
    r.active_wall_s = st.column_double(c++);
    r.avg_rss = st.column_opt_double(c++);
    finish_row(r);
    rows.push_back(std::move(r));
  }
  return rows;
}

} // namespace proctally::store
