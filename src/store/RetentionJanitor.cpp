#include "store/RetentionJanitor.hpp"
#include "util/Log.hpp"

namespace proctally::store {

RetentionJanitor::RetentionJanitor(Database& db, double retention_s, double interval_s)
  : db_(db), retention_s_(retention_s), interval_s_(interval_s) {}

int64_t RetentionJanitor::prune(double now_ts) {
  double cutoff = now_ts - retention_s_;
  auto st = db_.prepare("DELETE FROM sample WHERE ts < ?1");
  st.bind(1, cutoff);
  st.run();
  int64_t deleted = db_.changes();
  if (deleted > 0) {
    proctally::util::log_debug("janitor", "deleted %lld samples older than %.0fs",
                               static_cast<long long>(deleted), retention_s_);
  }
  return deleted;
}

int64_t RetentionJanitor::maybe_prune(double now_ts, std::chrono::steady_clock::time_point mono_now) {
  if (ran_ && std::chrono::duration<double>(mono_now - last_run_).count() < interval_s_) return 0;
  // Stamp before pruning: a failed prune waits for the next interval too
  last_run_ = mono_now;
  ran_ = true;
  return prune(now_ts);
}

} // namespace proctally::store
