#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include "app/SampleComputer.hpp"
#include "app/SessionTracker.hpp"
#include "collectors/IProcessEnumerator.hpp"
#include "store/RetentionJanitor.hpp"
#include "store/StorageWriter.hpp"

namespace proctally::app {

struct LoopOptions {
  std::chrono::duration<double> interval{1.0};
  double active_threshold{kDefaultActiveThreshold};
  int commit_attempts{3};
  std::chrono::milliseconds retry_backoff{250};
  uint64_t max_ticks{0}; // 0 = until stopped
};

// Drives enumerate -> track -> compute -> persist once per interval on a
// single thread. Stop requests are honoured between ticks only, so every
// tick either commits fully or the loop reports a fatal storage error.
class SamplerLoop {
public:
  SamplerLoop(proctally::collectors::IProcessEnumerator& enumerator,
              proctally::store::StorageWriter& writer,
              proctally::store::RetentionJanitor& janitor,
              LoopOptions opts);
  ~SamplerLoop();
  SamplerLoop(const SamplerLoop&) = delete;
  SamplerLoop& operator=(const SamplerLoop&) = delete;

  // Run on a background jthread / request stop and join.
  void start();
  void stop();
  [[nodiscard]] bool finished() const { return finished_.load(); }

  // Blocking loop on the calling thread. Returns false after a fatal
  // storage failure (see failure()), true on stop or max_ticks.
  bool run(std::stop_token st);

  // One tick at explicit clocks. Throws StoreError when the batch could
  // not be committed within commit_attempts.
  proctally::store::CommitStats tick(std::chrono::steady_clock::time_point mono_now, double wall_now);

  [[nodiscard]] uint64_t ticks() const { return ticks_; }
  [[nodiscard]] bool failed() const { return failed_.load(); }
  [[nodiscard]] const std::string& failure() const { return failure_; }
  [[nodiscard]] const SessionTracker& tracker() const { return tracker_; }

private:
  proctally::store::CommitStats commit_with_retry(const proctally::model::TickBatch& batch);
  void sleep_until(std::stop_token& st, std::chrono::steady_clock::time_point deadline);

  proctally::collectors::IProcessEnumerator& enumerator_;
  proctally::store::StorageWriter& writer_;
  proctally::store::RetentionJanitor& janitor_;
  LoopOptions opts_;
  SessionTracker tracker_{};
  proctally::model::ProcTable table_{};
  uint64_t ticks_{0};
  std::atomic<bool> failed_{false};
  std::atomic<bool> finished_{false};
  std::string failure_;
  std::mutex sleep_mu_;
  std::condition_variable_any sleep_cv_;
  std::jthread thread_{};
};

} // namespace proctally::app
