#include "app/SamplerLoop.hpp"
#include "util/Log.hpp"
#include "util/TimeSpec.hpp"

using namespace std::chrono;

namespace proctally::app {

SamplerLoop::SamplerLoop(proctally::collectors::IProcessEnumerator& enumerator,
                         proctally::store::StorageWriter& writer,
                         proctally::store::RetentionJanitor& janitor,
                         LoopOptions opts)
  : enumerator_(enumerator), writer_(writer), janitor_(janitor), opts_(opts) {
  if (opts_.commit_attempts < 1) opts_.commit_attempts = 1;
}

SamplerLoop::~SamplerLoop() { stop(); }

void SamplerLoop::start() {
  if (thread_.joinable()) return;
  finished_.store(false);
  thread_ = std::jthread([this](std::stop_token st){
    (void)run(st);
    finished_.store(true);
  });
}

void SamplerLoop::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

proctally::store::CommitStats SamplerLoop::commit_with_retry(const proctally::model::TickBatch& batch) {
  for (int attempt = 1; ; ++attempt) {
    try {
      return writer_.commit(batch);
    } catch (const proctally::store::StoreError& e) {
      if (attempt >= opts_.commit_attempts) throw;
      proctally::util::log_warn("sampler", "tick commit failed (attempt %d/%d): %s",
                                attempt, opts_.commit_attempts, e.what());
      std::this_thread::sleep_for(opts_.retry_backoff * attempt);
    }
  }
}

proctally::store::CommitStats SamplerLoop::tick(steady_clock::time_point mono_now, double wall_now) {
  if (!enumerator_.enumerate(table_)) {
    // Without a table there is no presence information; skipping keeps
    // live sessions from being counted as missed.
    proctally::util::log_warn("sampler", "%s unavailable, tick skipped", enumerator_.name());
    return {};
  }
  auto up = tracker_.observe(table_.processes, mono_now, wall_now);

  proctally::model::TickBatch batch;
  batch.ts = wall_now;
  batch.sessions.reserve(up.present.size());
  SampleParams params{table_.logical_cores, opts_.active_threshold};
  for (const auto& ob : up.present) {
    const auto& r = *ob.reading;
    proctally::model::SessionInfo si;
    si.key = r.key;
    si.exe_path = r.exe_path;
    si.name = r.name;
    si.cmdline = r.cmdline;
    si.username = r.username;
    si.ppid = r.ppid;
    si.first_seen = ob.first_seen;
    si.last_seen = wall_now;
    si.partial_meta = ob.partial_meta;
    batch.sessions.push_back(std::move(si));

    if (ob.first) continue;
    if (ob.dt_s || !r.cpu_time_s) {
      if (auto s = compute_sample(r, wall_now, ob.dt_s.value_or(0.0), ob.delta_cpu_s, params)) {
        batch.samples.push_back(*s);
      }
    }
  }
  batch.ended = std::move(up.ended);

  auto stats = commit_with_retry(batch);
  ++ticks_;
  proctally::util::log_debug("sampler", "tick %llu: %zu sessions, %zu samples, %zu ended",
                             static_cast<unsigned long long>(ticks_), stats.sessions, stats.samples, stats.ended);

  try {
    (void)janitor_.maybe_prune(wall_now, mono_now);
  } catch (const proctally::store::StoreError& e) {
    // Retention is retried on the next due run; the tick itself is committed
    proctally::util::log_warn("janitor", "prune failed: %s", e.what());
  }
  return stats;
}

void SamplerLoop::sleep_until(std::stop_token& st, steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lk(sleep_mu_);
  (void)sleep_cv_.wait_until(lk, st, deadline, []{ return false; });
}

bool SamplerLoop::run(std::stop_token st) {
  proctally::util::log_info("sampler",
                            "start: interval=%.3fs, active_threshold=%.4f, retention=%.0fs, source=%s",
                            opts_.interval.count(), opts_.active_threshold, janitor_.retention_s(), enumerator_.name());
  tracker_.clear();
  auto interval = duration_cast<steady_clock::duration>(opts_.interval);
  if (interval <= steady_clock::duration::zero()) interval = milliseconds(1);
  const auto base = steady_clock::now();
  uint64_t slot = 0;
  bool ok = true;

  while (!st.stop_requested()) {
    auto target = base + interval * static_cast<int64_t>(slot);
    if (steady_clock::now() < target) sleep_until(st, target);
    if (st.stop_requested()) break;

    try {
      (void)tick(steady_clock::now(), proctally::util::wall_now());
    } catch (const proctally::store::StoreError& e) {
      failure_ = e.what();
      failed_.store(true);
      proctally::util::log_error("sampler", "cannot persist tick, stopping: %s", e.what());
      ok = false;
      break;
    }
    if (opts_.max_ticks > 0 && ticks_ >= opts_.max_ticks) break;

    // Overran one or more slots: resume on the next future slot rather than bursting
    auto now = steady_clock::now();
    ++slot;
    while (base + interval * static_cast<int64_t>(slot) <= now) ++slot;
  }
  tracker_.clear();
  proctally::util::log_info("sampler", "stopped after %llu ticks", static_cast<unsigned long long>(ticks_));
  return ok;
}

} // namespace proctally::app
