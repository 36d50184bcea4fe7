#pragma once
#include "store/Database.hpp"
#include "util/TimeSpec.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace proctally::store {

enum class GroupBy { Executable, Session };

// "exe" / "by-executable" and "pid" / "by-session"
[[nodiscard]] std::optional<GroupBy> parse_group(std::string_view s);
// As parse_group, throwing std::invalid_argument that names --group.
[[nodiscard]] GroupBy require_group(const std::string& s);

struct AggregateRow {
  std::string exe_path;               // exe path, else process name, else "<unknown>"
  std::optional<int32_t> pid;         // Session grouping only
  std::optional<double> create_time;  // Session grouping only
  int64_t samples{};
  double cpu_s{};
  double wall_s{};
  double active_wall_s{};
  double avg_eff_cores{};
  double avg_cpu_percent{};
  std::optional<double> avg_rss;      // null when no sample carried rss
};

struct AggregateQuery {
  proctally::util::TimeWindow window{};
  GroupBy group{GroupBy::Executable};
  std::optional<int> limit;           // none = all groups
};

// Windowed reduction of samples joined to their session, ordered by cpu_s
// descending. Pure read; safe to run while a sampler is writing (WAL).
class Aggregator {
public:
  explicit Aggregator(Database& db) : db_(db) {}
  [[nodiscard]] std::vector<AggregateRow> aggregate(const AggregateQuery& q);
private:
  Database& db_;
};

} // namespace proctally::store
