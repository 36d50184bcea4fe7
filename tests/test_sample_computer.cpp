#include "minitest.hpp"
#include "app/SampleComputer.hpp"

using proctally::app::compute_sample;
using proctally::app::equivalent_cores;
using proctally::app::SampleParams;

static proctally::model::ProcReading reading(double cpu) {
  proctally::model::ProcReading r;
  r.key = {1234, 1700000000.0};
  r.name = "worker";
  r.cpu_time_s = cpu;
  r.rss_bytes = 4096;
  r.io_read_bytes = 10;
  return r;
}

TEST(eff_cores_is_cpu_over_wall) {
  ASSERT_NEAR(equivalent_cores(0.5, 1.0, 4), 0.5, 1e-12);
  ASSERT_NEAR(equivalent_cores(3.0, 2.0, 4), 1.5, 1e-12);
  ASSERT_NEAR(equivalent_cores(0.0, 1.0, 4), 0.0, 1e-12);
}

TEST(eff_cores_capped_at_one_and_half_cores) {
  // 2 cores -> cap 3.0
  ASSERT_NEAR(equivalent_cores(10.0, 1.0, 2), 3.0, 1e-12);
  // zero cores treated as one
  ASSERT_NEAR(equivalent_cores(10.0, 1.0, 0), 1.5, 1e-12);
}

TEST(eff_cores_zero_for_nonpositive_dt) {
  ASSERT_NEAR(equivalent_cores(1.0, 0.0, 4), 0.0, 1e-12);
  ASSERT_NEAR(equivalent_cores(1.0, -0.5, 4), 0.0, 1e-12);
}

TEST(sample_active_threshold_inclusive) {
  SampleParams p{4, 0.005};
  auto s = compute_sample(reading(10.0), 100.0, 1.0, 0.005, p);
  ASSERT_TRUE(s.has_value());
  ASSERT_TRUE(s->active);
  auto idle = compute_sample(reading(10.0), 100.0, 1.0, 0.004, p);
  ASSERT_TRUE(idle.has_value());
  ASSERT_TRUE(!idle->active);
  ASSERT_NEAR(idle->eff_cores, 0.004, 1e-12);
}

TEST(sample_carries_memory_and_io) {
  auto s = compute_sample(reading(1.0), 50.0, 2.0, 1.0, SampleParams{2, 0.005});
  ASSERT_TRUE(s.has_value());
  ASSERT_NEAR(s->ts, 50.0, 1e-12);
  ASSERT_NEAR(s->dt_s, 2.0, 1e-12);
  ASSERT_NEAR(s->eff_cores, 0.5, 1e-12);
  ASSERT_EQ(s->rss_bytes.value_or(-1), 4096);
  ASSERT_TRUE(!s->vms_bytes.has_value());
  ASSERT_EQ(s->io_read_bytes.value_or(-1), 10);
  ASSERT_EQ(s->key.pid, 1234);
}

TEST(sample_absent_without_cpu_or_dt) {
  auto r = reading(1.0);
  ASSERT_TRUE(!compute_sample(r, 1.0, 0.0, 0.1, SampleParams{}).has_value());
  ASSERT_TRUE(!compute_sample(r, 1.0, -1.0, 0.1, SampleParams{}).has_value());
  r.cpu_time_s.reset();
  ASSERT_TRUE(!compute_sample(r, 1.0, 1.0, 0.1, SampleParams{}).has_value());
}
