#include "minitest.hpp"
#include "test_helpers.hpp"
#include "store/Maintenance.hpp"
#include "store/RetentionJanitor.hpp"
#include "store/StorageWriter.hpp"

using namespace proctally::store;
using proctally::test::count_rows;
using proctally::test::sample;
using proctally::test::session;

TEST(store_open_applies_wal_and_schema) {
  auto path = proctally::test::temp_db("open");
  {
    Database db(path);
    ASSERT_EQ(db.journal_mode(), std::string("wal"));
    ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM process"), 0);
    ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM sample"), 0);
    ASSERT_EQ(count_rows(db, "PRAGMA foreign_keys"), 1);
  }
  // Reopen keeps schema
  Database again(path);
  ASSERT_EQ(count_rows(again, "SELECT COUNT(*) FROM process"), 0);
  proctally::test::remove_db(path);
}

TEST(store_commit_writes_tick) {
  auto path = proctally::test::temp_db("commit");
  Database db(path);
  StorageWriter w(db);
  proctally::model::TickBatch b;
  b.ts = 100.0;
  b.sessions = {session(1, 10.0, "/bin/a", 99.0, 100.0), session(2, 20.0, nullptr, 99.0, 100.0)};
  b.samples = {sample(1, 10.0, 100.0, 1.0, 0.5)};
  auto stats = w.commit(b);
  ASSERT_EQ(stats.sessions, 2u);
  ASSERT_EQ(stats.samples, 1u);
  ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM process"), 2);
  ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM sample"), 1);
  ASSERT_TRUE(w.session_id({1, 10.0}).has_value());
  ASSERT_TRUE(!w.session_id({1, 11.0}).has_value());
  proctally::test::remove_db(path);
}

TEST(store_failed_tick_leaves_nothing) {
  auto path = proctally::test::temp_db("atomic");
  Database db(path);
  StorageWriter w(db);
  proctally::model::TickBatch b;
  b.ts = 100.0;
  b.sessions = {session(1, 10.0, "/bin/a", 99.0, 100.0)};
  b.samples = {sample(1, 10.0, 100.0, 1.0, 0.5), sample(9, 90.0, 100.0, 1.0, 0.5)};
  ASSERT_THROWS((void)w.commit(b), StoreError);
  ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM process"), 0);
  ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM sample"), 0);
  // Writer stays usable after the rollback
  b.samples.pop_back();
  (void)w.commit(b);
  ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM sample"), 1);
  proctally::test::remove_db(path);
}

TEST(store_upsert_keeps_metadata_and_flags) {
  auto path = proctally::test::temp_db("upsert");
  Database db(path);
  StorageWriter w(db);
  proctally::model::TickBatch b1;
  auto s = session(1, 10.0, "/bin/a", 100.0, 100.0);
  s.partial_meta = true;
  b1.sessions = {s};
  (void)w.commit(b1);

  proctally::model::TickBatch b2;
  auto later = session(1, 10.0, nullptr, 101.0, 101.0);
  later.cmdline = "a --x";
  b2.sessions = {later};
  (void)w.commit(b2);

  auto st = db.prepare("SELECT exe_path, cmdline, first_seen, last_seen, partial_meta FROM process WHERE pid = 1");
  ASSERT_TRUE(st.step());
  ASSERT_EQ(st.column_text(0), std::string("/bin/a"));
  ASSERT_EQ(st.column_text(1), std::string("a --x"));
  ASSERT_NEAR(st.column_double(2), 100.0, 1e-9);
  ASSERT_NEAR(st.column_double(3), 101.0, 1e-9);
  ASSERT_EQ(st.column_int64(4), 1);
  proctally::test::remove_db(path);
}

TEST(store_ended_is_never_cleared) {
  auto path = proctally::test::temp_db("ended");
  Database db(path);
  StorageWriter w(db);
  proctally::model::TickBatch b1;
  b1.sessions = {session(1, 10.0, "/bin/a", 100.0, 100.0)};
  (void)w.commit(b1);
  proctally::model::TickBatch b2;
  b2.ended = {proctally::model::SessionEnd{{1, 10.0}, 100.0}};
  ASSERT_EQ(w.commit(b2).ended, 1u);
  ASSERT_EQ(count_rows(db, "SELECT ended FROM process WHERE pid = 1"), 1);
  // A later upsert of the same key must not revive it
  proctally::model::TickBatch b3;
  b3.sessions = {session(1, 10.0, "/bin/a", 100.0, 103.0)};
  (void)w.commit(b3);
  ASSERT_EQ(count_rows(db, "SELECT ended FROM process WHERE pid = 1"), 1);
  proctally::test::remove_db(path);
}

TEST(store_busy_writer_reports_contention) {
  auto path = proctally::test::temp_db("busy");
  Database holder(path);
  Database other(path, 50);
  StorageWriter w(other);
  proctally::model::TickBatch b;
  b.sessions = {session(1, 10.0, "/bin/a", 100.0, 100.0)};
  {
    Transaction lock(holder);
    bool busy = false;
    try {
      (void)w.commit(b);
    } catch (const StoreError& e) {
      busy = e.busy();
    }
    ASSERT_TRUE(busy);
  }
  (void)w.commit(b);
  ASSERT_EQ(count_rows(other, "SELECT COUNT(*) FROM process"), 1);
  proctally::test::remove_db(path);
}

TEST(janitor_prunes_old_samples_only) {
  auto path = proctally::test::temp_db("janitor");
  Database db(path);
  StorageWriter w(db);
  proctally::model::TickBatch b;
  b.sessions = {session(1, 10.0, "/bin/a", 0.0, 1000.0)};
  b.samples = {sample(1, 10.0, 100.0, 1.0, 0.1), sample(1, 10.0, 500.0, 1.0, 0.1),
               sample(1, 10.0, 950.0, 1.0, 0.1)};
  (void)w.commit(b);
  RetentionJanitor j(db, 600.0, 60.0);
  // cutoff 400: only ts=100 is older
  ASSERT_EQ(j.prune(1000.0), 1);
  ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM sample"), 2);
  ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM process"), 1);
  // Idempotent for the same cutoff
  ASSERT_EQ(j.prune(1000.0), 0);
  ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM sample"), 2);
  proctally::test::remove_db(path);
}

TEST(janitor_keeps_sample_on_cutoff) {
  auto path = proctally::test::temp_db("janitor_edge");
  Database db(path);
  StorageWriter w(db);
  proctally::model::TickBatch b;
  b.sessions = {session(1, 10.0, "/bin/a", 0.0, 1000.0)};
  b.samples = {sample(1, 10.0, 399.5, 1.0, 0.1), sample(1, 10.0, 400.0, 1.0, 0.1)};
  (void)w.commit(b);
  RetentionJanitor j(db, 600.0, 60.0);
  ASSERT_EQ(j.prune(1000.0), 1);
  ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM sample WHERE ts = 400.0"), 1);
  ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM sample"), 1);
  proctally::test::remove_db(path);
}

TEST(janitor_runs_at_most_once_per_interval) {
  auto path = proctally::test::temp_db("janitor_due");
  Database db(path);
  StorageWriter w(db);
  proctally::model::TickBatch b;
  b.sessions = {session(1, 10.0, "/bin/a", 0.0, 1000.0)};
  b.samples = {sample(1, 10.0, 100.0, 1.0, 0.1), sample(1, 10.0, 130.0, 1.0, 0.1)};
  (void)w.commit(b);
  RetentionJanitor j(db, 10.0, 60.0);
  auto t0 = std::chrono::steady_clock::time_point{} + std::chrono::hours(1);
  ASSERT_EQ(j.maybe_prune(120.0, t0), 1);
  ASSERT_EQ(j.maybe_prune(150.0, t0 + std::chrono::seconds(30)), 0); // not due yet
  ASSERT_EQ(j.maybe_prune(180.0, t0 + std::chrono::seconds(60)), 1);
  proctally::test::remove_db(path);
}

TEST(janitor_cadence_ignores_wall_clock_steps) {
  auto path = proctally::test::temp_db("janitor_step");
  Database db(path);
  StorageWriter w(db);
  proctally::model::TickBatch b;
  b.sessions = {session(1, 10.0, "/bin/a", 0.0, 1000.0)};
  b.samples = {sample(1, 10.0, 100.0, 1.0, 0.1), sample(1, 10.0, 500.0, 1.0, 0.1)};
  (void)w.commit(b);
  RetentionJanitor j(db, 10.0, 60.0);
  auto t0 = std::chrono::steady_clock::time_point{} + std::chrono::hours(1);
  ASSERT_EQ(j.maybe_prune(200.0, t0), 1);
  // Wall clock jumps forward by an hour: still not due on the monotonic clock
  ASSERT_EQ(j.maybe_prune(3800.0, t0 + std::chrono::seconds(5)), 0);
  ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM sample"), 1);
  // Wall clock steps back behind the last run: due once the interval elapsed
  ASSERT_EQ(j.maybe_prune(600.0, t0 + std::chrono::seconds(61)), 1);
  ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM sample"), 0);
  proctally::test::remove_db(path);
}

TEST(maintenance_reset_and_vacuum) {
  auto path = proctally::test::temp_db("reset");
  Database db(path);
  StorageWriter w(db);
  proctally::model::TickBatch b;
  b.sessions = {session(1, 10.0, "/bin/a", 0.0, 1.0)};
  b.samples = {sample(1, 10.0, 1.0, 1.0, 0.1)};
  (void)w.commit(b);
  vacuum(db);
  ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM sample"), 1);
  reset(db);
  ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM sample"), 0);
  ASSERT_EQ(count_rows(db, "SELECT COUNT(*) FROM process"), 0);
  proctally::test::remove_db(path);
}
