#include "store/StorageWriter.hpp"
#include <unordered_map>

namespace proctally::store {

// Existing metadata wins over later reads; partial_meta is sticky and
// ended is never touched here.
static const char* kUpsertSql = R"SQL(
INSERT INTO process
  (pid, create_time, exe_path, name, cmdline, username, ppid, first_seen, last_seen, ended, partial_meta)
VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, 0, ?10)
ON CONFLICT(pid, create_time) DO UPDATE SET
  last_seen = MAX(last_seen, excluded.last_seen),
  exe_path = COALESCE(exe_path, excluded.exe_path),
  name = COALESCE(name, excluded.name),
  cmdline = COALESCE(cmdline, excluded.cmdline),
  username = COALESCE(username, excluded.username),
  ppid = COALESCE(ppid, excluded.ppid),
  partial_meta = (partial_meta OR excluded.partial_meta)
)SQL";

static const char* kSelectIdSql = "SELECT id FROM process WHERE pid = ?1 AND create_time = ?2";

static const char* kInsertSampleSql = R"SQL(
INSERT INTO sample
  (ts, process_id, dt_s, delta_cpu_s, eff_cores, active, rss_bytes, vms_bytes, io_read_bytes, io_write_bytes)
VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)
)SQL";

static const char* kMarkEndedSql =
    "UPDATE process SET ended = 1, last_seen = MAX(last_seen, ?3) WHERE pid = ?1 AND create_time = ?2";

StorageWriter::StorageWriter(Database& db)
  : db_(db),
    upsert_(db.prepare(kUpsertSql)),
    select_id_(db.prepare(kSelectIdSql)),
    insert_sample_(db.prepare(kInsertSampleSql)),
    mark_ended_(db.prepare(kMarkEndedSql)) {}

std::optional<int64_t> StorageWriter::session_id(const proctally::model::SessionKey& key) {
  select_id_.reset();
  select_id_.bind(1, key.pid).bind(2, key.create_time);
  std::optional<int64_t> id;
  if (select_id_.step()) id = select_id_.column_int64(0);
  select_id_.reset();
  return id;
}

int64_t StorageWriter::upsert_session(const proctally::model::SessionInfo& s) {
  upsert_.reset();
  upsert_.bind(1, s.key.pid)
         .bind(2, s.key.create_time)
         .bind(3, s.exe_path)
         .bind(4, s.name)
         .bind(5, s.cmdline)
         .bind(6, s.username)
         .bind(7, s.ppid)
         .bind(8, s.first_seen)
         .bind(9, s.last_seen)
         .bind(10, s.partial_meta ? 1 : 0);
  upsert_.run();
  upsert_.reset();
  auto id = session_id(s.key);
  if (!id) throw StoreError("session row missing after upsert", 0);
  return *id;
}

CommitStats StorageWriter::commit(const proctally::model::TickBatch& batch) {
  CommitStats stats;
  std::unordered_map<proctally::model::SessionKey, int64_t, proctally::model::SessionKeyHash> ids;
  ids.reserve(batch.sessions.size());

  Transaction tx(db_);
  for (const auto& s : batch.sessions) {
    ids[s.key] = upsert_session(s);
    stats.sessions++;
  }
  for (const auto& smp : batch.samples) {
    int64_t pid_row = 0;
    if (auto it = ids.find(smp.key); it != ids.end()) {
      pid_row = it->second;
    } else if (auto id = session_id(smp.key)) {
      pid_row = *id;
    } else {
      throw StoreError("sample for unknown session pid " + std::to_string(smp.key.pid), 0);
    }
    insert_sample_.reset();
    insert_sample_.bind(1, smp.ts)
                  .bind(2, pid_row)
                  .bind(3, smp.dt_s)
                  .bind(4, smp.delta_cpu_s)
                  .bind(5, smp.eff_cores)
                  .bind(6, smp.active ? 1 : 0)
                  .bind(7, smp.rss_bytes)
                  .bind(8, smp.vms_bytes)
                  .bind(9, smp.io_read_bytes)
                  .bind(10, smp.io_write_bytes);
    insert_sample_.run();
    stats.samples++;
  }
  for (const auto& e : batch.ended) {
    mark_ended_.reset();
    mark_ended_.bind(1, e.key.pid).bind(2, e.key.create_time).bind(3, e.last_seen);
    mark_ended_.run();
    stats.ended++;
  }
  insert_sample_.reset();
  mark_ended_.reset();
  tx.commit();
  return stats;
}

} // namespace proctally::store
