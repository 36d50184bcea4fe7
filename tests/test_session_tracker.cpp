#include "minitest.hpp"
#include "app/SessionTracker.hpp"

using namespace std::chrono;
using proctally::app::SessionTracker;
using proctally::model::ProcReading;

static ProcReading proc(int32_t pid, double ctime, std::optional<double> cpu) {
  ProcReading r;
  r.key = {pid, ctime};
  r.name = "p" + std::to_string(pid);
  r.cpu_time_s = cpu;
  return r;
}

static steady_clock::time_point t0() { return steady_clock::time_point{} + hours(1); }

TEST(tracker_first_observation_has_no_delta) {
  SessionTracker t;
  std::vector<ProcReading> tick{proc(10, 100.0, 5.0)};
  auto up = t.observe(tick, t0(), 1000.0);
  ASSERT_EQ(up.present.size(), 1u);
  ASSERT_TRUE(up.present[0].first);
  ASSERT_TRUE(!up.present[0].dt_s.has_value());
  ASSERT_NEAR(up.present[0].first_seen, 1000.0, 1e-9);
  ASSERT_TRUE(t.tracking({10, 100.0}));
}

TEST(tracker_delta_and_monotonic_dt) {
  SessionTracker t;
  std::vector<ProcReading> a{proc(10, 100.0, 5.0)};
  (void)t.observe(a, t0(), 1000.0);
  std::vector<ProcReading> b{proc(10, 100.0, 5.25)};
  // Wall clock jumps backwards; dt still comes from the monotonic clock
  auto up = t.observe(b, t0() + milliseconds(500), 990.0);
  ASSERT_EQ(up.present.size(), 1u);
  ASSERT_TRUE(!up.present[0].first);
  ASSERT_NEAR(*up.present[0].dt_s, 0.5, 1e-9);
  ASSERT_NEAR(up.present[0].delta_cpu_s, 0.25, 1e-9);
  ASSERT_NEAR(up.present[0].first_seen, 1000.0, 1e-9);
}

TEST(tracker_clamps_negative_delta) {
  SessionTracker t;
  std::vector<ProcReading> a{proc(10, 100.0, 5.0)};
  (void)t.observe(a, t0(), 1.0);
  std::vector<ProcReading> b{proc(10, 100.0, 4.0)};
  auto up = t.observe(b, t0() + seconds(1), 2.0);
  ASSERT_NEAR(up.present[0].delta_cpu_s, 0.0, 1e-12);
  // Baseline moved to the lower reading
  std::vector<ProcReading> c{proc(10, 100.0, 4.5)};
  up = t.observe(c, t0() + seconds(2), 3.0);
  ASSERT_NEAR(up.present[0].delta_cpu_s, 0.5, 1e-12);
}

TEST(tracker_ends_after_two_missed_ticks) {
  SessionTracker t;
  std::vector<ProcReading> live{proc(10, 100.0, 1.0)};
  std::vector<ProcReading> none;
  (void)t.observe(live, t0(), 10.0);
  auto up = t.observe(none, t0() + seconds(1), 11.0);
  ASSERT_TRUE(up.ended.empty());
  ASSERT_EQ(t.missed_ticks({10, 100.0}), 1);
  up = t.observe(none, t0() + seconds(2), 12.0);
  ASSERT_EQ(up.ended.size(), 1u);
  ASSERT_EQ(up.ended[0].key.pid, 10);
  ASSERT_NEAR(up.ended[0].last_seen, 10.0, 1e-9);
  ASSERT_TRUE(!t.tracking({10, 100.0}));
}

TEST(tracker_single_miss_resets_on_return) {
  SessionTracker t;
  std::vector<ProcReading> live{proc(10, 100.0, 1.0)};
  std::vector<ProcReading> none;
  (void)t.observe(live, t0(), 10.0);
  (void)t.observe(none, t0() + seconds(1), 11.0);
  std::vector<ProcReading> back{proc(10, 100.0, 3.0)};
  auto up = t.observe(back, t0() + seconds(2), 12.0);
  ASSERT_TRUE(up.ended.empty());
  ASSERT_EQ(t.missed_ticks({10, 100.0}), 0);
  // Delta spans the gap from the last successful read
  ASSERT_NEAR(*up.present[0].dt_s, 2.0, 1e-9);
  ASSERT_NEAR(up.present[0].delta_cpu_s, 2.0, 1e-9);
  up = t.observe(none, t0() + seconds(3), 13.0);
  ASSERT_TRUE(up.ended.empty());
}

TEST(tracker_pid_reuse_is_new_session) {
  SessionTracker t;
  std::vector<ProcReading> a{proc(10, 100.0, 50.0)};
  (void)t.observe(a, t0(), 10.0);
  std::vector<ProcReading> b{proc(10, 200.0, 0.1)};
  auto up = t.observe(b, t0() + seconds(1), 11.0);
  ASSERT_EQ(up.present.size(), 1u);
  ASSERT_TRUE(up.present[0].first);
  ASSERT_TRUE(!up.present[0].dt_s.has_value());
  ASSERT_EQ(t.size(), 2u);
  up = t.observe(b, t0() + seconds(2), 12.0);
  ASSERT_EQ(up.ended.size(), 1u);
  ASSERT_NEAR(up.ended[0].key.create_time, 100.0, 1e-9);
}

TEST(tracker_unreadable_cpu_keeps_previous_baseline) {
  SessionTracker t;
  std::vector<ProcReading> a{proc(10, 100.0, 1.0)};
  (void)t.observe(a, t0(), 10.0);
  std::vector<ProcReading> b{proc(10, 100.0, std::nullopt)};
  auto up = t.observe(b, t0() + seconds(1), 11.0);
  ASSERT_TRUE(!up.present[0].dt_s.has_value());
  std::vector<ProcReading> c{proc(10, 100.0, 2.0)};
  up = t.observe(c, t0() + seconds(2), 12.0);
  ASSERT_NEAR(*up.present[0].dt_s, 2.0, 1e-9);
  ASSERT_NEAR(up.present[0].delta_cpu_s, 1.0, 1e-9);
}

TEST(tracker_partial_meta_is_sticky) {
  SessionTracker t;
  auto r = proc(10, 100.0, 1.0);
  r.partial = true;
  std::vector<ProcReading> a{r};
  auto up = t.observe(a, t0(), 10.0);
  ASSERT_TRUE(up.present[0].partial_meta);
  std::vector<ProcReading> b{proc(10, 100.0, 1.5)};
  up = t.observe(b, t0() + seconds(1), 11.0);
  ASSERT_TRUE(up.present[0].partial_meta);
}

TEST(tracker_zero_dt_advances_state) {
  SessionTracker t;
  std::vector<ProcReading> a{proc(10, 100.0, 1.0)};
  (void)t.observe(a, t0(), 10.0);
  std::vector<ProcReading> b{proc(10, 100.0, 1.2)};
  auto up = t.observe(b, t0(), 10.0);
  ASSERT_NEAR(*up.present[0].dt_s, 0.0, 1e-12);
  std::vector<ProcReading> c{proc(10, 100.0, 1.5)};
  up = t.observe(c, t0() + seconds(1), 11.0);
  ASSERT_NEAR(up.present[0].delta_cpu_s, 0.3, 1e-9);
}

TEST(tracker_duplicate_rows_counted_once) {
  SessionTracker t;
  std::vector<ProcReading> a{proc(10, 100.0, 1.0), proc(10, 100.0, 1.0)};
  auto up = t.observe(a, t0(), 10.0);
  ASSERT_EQ(up.present.size(), 1u);
}
