#include "store/Database.hpp"
#include "util/Log.hpp"
#include <sqlite3.h>
#include <utility>

namespace proctally::store {

static const char* kSchemaSql = R"SQL(
CREATE TABLE IF NOT EXISTS process (
  id INTEGER PRIMARY KEY,
  pid INTEGER NOT NULL,
  create_time REAL NOT NULL,
  exe_path TEXT,
  name TEXT,
  cmdline TEXT,
  username TEXT,
  ppid INTEGER,
  first_seen REAL NOT NULL,
  last_seen REAL NOT NULL,
  ended INTEGER NOT NULL DEFAULT 0 CHECK (ended IN (0,1)),
  partial_meta INTEGER NOT NULL DEFAULT 0 CHECK (partial_meta IN (0,1)),
  UNIQUE (pid, create_time)
);
CREATE TABLE IF NOT EXISTS sample (
  id INTEGER PRIMARY KEY,
  ts REAL NOT NULL,
  process_id INTEGER NOT NULL REFERENCES process(id),
  dt_s REAL NOT NULL,
  delta_cpu_s REAL NOT NULL CHECK (delta_cpu_s >= 0),
  eff_cores REAL NOT NULL,
  active INTEGER NOT NULL CHECK (active IN (0,1)),
  rss_bytes INTEGER,
  vms_bytes INTEGER,
  io_read_bytes INTEGER,
  io_write_bytes INTEGER
);
CREATE INDEX IF NOT EXISTS idx_process_exe_path ON process(exe_path);
CREATE INDEX IF NOT EXISTS idx_process_ended ON process(ended);
CREATE INDEX IF NOT EXISTS idx_sample_ts ON sample(ts);
CREATE INDEX IF NOT EXISTS idx_sample_process_ts ON sample(process_id, ts);
)SQL";

bool StoreError::busy() const noexcept {
  int primary = code_ & 0xff;
  return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

static StoreError make_error(sqlite3* db, int rc, const std::string& ctx) {
  const char* msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  int code = db ? sqlite3_extended_errcode(db) : rc;
  return StoreError(ctx + ": " + (msg ? msg : "unknown error"), code);
}

// ---- Statement ----

Statement::Statement(sqlite3* db, std::string_view sql) : db_(db) {
  int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    throw make_error(db_, rc, "prepare");
  }
}

Statement::~Statement() { if (stmt_) sqlite3_finalize(stmt_); }

Statement::Statement(Statement&& o) noexcept
    : db_(std::exchange(o.db_, nullptr)), stmt_(std::exchange(o.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& o) noexcept {
  if (this != &o) {
    if (stmt_) sqlite3_finalize(stmt_);
    db_ = std::exchange(o.db_, nullptr);
    stmt_ = std::exchange(o.stmt_, nullptr);
  }
  return *this;
}

static void check_bind(sqlite3* db, int rc) {
  if (rc != SQLITE_OK) throw make_error(db, rc, "bind");
}

Statement& Statement::bind(int idx, int v) { check_bind(db_, sqlite3_bind_int(stmt_, idx, v)); return *this; }
Statement& Statement::bind(int idx, int64_t v) { check_bind(db_, sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v))); return *this; }
Statement& Statement::bind(int idx, double v) { check_bind(db_, sqlite3_bind_double(stmt_, idx, v)); return *this; }
Statement& Statement::bind(int idx, const std::string& v) {
  check_bind(db_, sqlite3_bind_text(stmt_, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT));
  return *this;
}
Statement& Statement::bind_null(int idx) { check_bind(db_, sqlite3_bind_null(stmt_, idx)); return *this; }

bool Statement::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw make_error(db_, rc, "step");
}

void Statement::reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

bool Statement::column_is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
int64_t Statement::column_int64(int col) const { return static_cast<int64_t>(sqlite3_column_int64(stmt_, col)); }
double Statement::column_double(int col) const { return sqlite3_column_double(stmt_, col); }

std::string Statement::column_text(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  if (!t) return {};
  return std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

std::optional<double> Statement::column_opt_double(int col) const {
  if (column_is_null(col)) return std::nullopt;
  return column_double(col);
}

std::optional<std::string> Statement::column_opt_text(int col) const {
  if (column_is_null(col)) return std::nullopt;
  return column_text(col);
}

// ---- Database ----

Database::Database(const std::string& path, int busy_timeout_ms) : path_(path) {
  int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    StoreError err = make_error(db_, rc, "open " + path);
    sqlite3_close(db_);
    db_ = nullptr;
    throw err;
  }
  sqlite3_extended_result_codes(db_, 1);
  sqlite3_busy_timeout(db_, busy_timeout_ms);
  try {
    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");
    exec("PRAGMA temp_store=MEMORY");
    exec("PRAGMA foreign_keys=ON");
    init_schema();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

Database::~Database() {
  if (db_) sqlite3_close(db_);
}

void Database::exec(const char* sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw StoreError(std::string("exec: ") + msg, sqlite3_extended_errcode(db_));
  }
}

Statement Database::prepare(std::string_view sql) { return Statement(db_, sql); }

int64_t Database::changes() const { return static_cast<int64_t>(sqlite3_changes(db_)); }

std::string Database::journal_mode() {
  auto st = prepare("PRAGMA journal_mode");
  return st.step() ? st.column_text(0) : std::string();
}

void Database::init_schema() {
  exec(kSchemaSql);
  proctally::util::log_debug("store", "schema ready in %s (journal_mode=%s)", path_.c_str(), journal_mode().c_str());
}

// ---- Transaction ----

Transaction::Transaction(Database& db) : db_(db) { db_.exec("BEGIN IMMEDIATE"); }

Transaction::~Transaction() {
  if (done_) return;
  char* err = nullptr;
  if (sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
    proctally::util::log_warn("store", "rollback failed: %s", err ? err : "unknown");
  }
  sqlite3_free(err);
}

void Transaction::commit() {
  db_.exec("COMMIT");
  done_ = true;
}

} // namespace proctally::store
