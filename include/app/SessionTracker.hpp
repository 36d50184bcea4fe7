#pragma once
#include "model/Process.hpp"
#include <chrono>
#include <optional>
#include <unordered_map>
#include <vector>

namespace proctally::app {

// What the tracker learned about one session present in this tick.
struct Observation {
  const proctally::model::ProcReading* reading{nullptr};
  bool first{false};             // registered this tick; nothing to diff against
  std::optional<double> dt_s;    // monotonic seconds since the last successful read
  double delta_cpu_s{0.0};       // clamped to >= 0
  bool partial_meta{false};      // sticky across ticks
  double first_seen{};
};

struct TrackerUpdate {
  std::vector<Observation> present;
  std::vector<proctally::model::SessionEnd> ended;
};

// Live session table: previous CPU reading and presence history per
// (pid, create_time). Owned by the sampler loop for its whole run.
class SessionTracker {
public:
  // Consecutive ticks a session may be absent before it is declared ended.
  static constexpr int kMissedTicksToEnd = 2;

  // Diff one enumeration against the previous state. Readings must outlive
  // the returned Observations.
  TrackerUpdate observe(const std::vector<proctally::model::ProcReading>& procs,
                        std::chrono::steady_clock::time_point mono_now, double wall_now);

  [[nodiscard]] size_t size() const { return sessions_.size(); }
  [[nodiscard]] bool tracking(const proctally::model::SessionKey& key) const { return sessions_.count(key) != 0; }
  [[nodiscard]] int missed_ticks(const proctally::model::SessionKey& key) const;
  void clear() { sessions_.clear(); tick_ = 0; }

private:
  struct State {
    std::optional<double> prev_cpu_s;
    std::chrono::steady_clock::time_point last_mono{};
    double first_seen{};
    double last_seen{};
    int missed{0};
    bool partial{false};
    uint64_t seen_tick{0};
  };
  std::unordered_map<proctally::model::SessionKey, State, proctally::model::SessionKeyHash> sessions_;
  uint64_t tick_{0};
};

} // namespace proctally::app
