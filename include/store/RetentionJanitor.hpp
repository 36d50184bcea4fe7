#pragma once
#include "store/Database.hpp"
#include <chrono>
#include <cstdint>

namespace proctally::store {

// Drops samples older than the retention window. Session rows are kept.
class RetentionJanitor {
public:
  static constexpr double kDefaultIntervalS = 60.0;

  RetentionJanitor(Database& db, double retention_s, double interval_s = kDefaultIntervalS);

  // Delete samples with ts < now_ts - retention. Returns rows deleted.
  int64_t prune(double now_ts);

  // prune() if at least interval_s of monotonic time has passed since the last
  // run (or it never ran). now_ts only sets the cutoff, so wall clock steps do
  // not stall or burst the cadence. Returns rows deleted, 0 when not due.
  int64_t maybe_prune(double now_ts,
                      std::chrono::steady_clock::time_point mono_now = std::chrono::steady_clock::now());

  [[nodiscard]] double retention_s() const { return retention_s_; }

private:
  Database& db_;
  double retention_s_;
  double interval_s_;
  std::chrono::steady_clock::time_point last_run_{};
  bool ran_{false};
};

} // namespace proctally::store
