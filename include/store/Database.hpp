#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace proctally::store {

// Any SQLite failure. code() is the extended result code.
class StoreError : public std::runtime_error {
public:
  StoreError(const std::string& what, int code) : std::runtime_error(what), code_(code) {}
  [[nodiscard]] int code() const noexcept { return code_; }
  // Another connection holds the write lock past our busy timeout
  [[nodiscard]] bool busy() const noexcept;
private:
  int code_;
};

// Prepared statement bound to one connection. Move-only.
class Statement {
public:
  Statement(sqlite3* db, std::string_view sql);
  ~Statement();
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&& o) noexcept;
  Statement& operator=(Statement&& o) noexcept;

  Statement& bind(int idx, int v);
  Statement& bind(int idx, int64_t v);
  Statement& bind(int idx, double v);
  Statement& bind(int idx, const std::string& v);
  Statement& bind_null(int idx);
  template <typename T>
  Statement& bind(int idx, const std::optional<T>& v) { return v ? bind(idx, *v) : bind_null(idx); }

  // Advance; true while a result row is available, false when done.
  bool step();
  // Run to completion, ignoring rows.
  void run() { while (step()) {} }
  // Rewind and clear bindings for reuse.
  void reset();

  [[nodiscard]] bool column_is_null(int col) const;
  [[nodiscard]] int64_t column_int64(int col) const;
  [[nodiscard]] double column_double(int col) const;
  [[nodiscard]] std::string column_text(int col) const;
  [[nodiscard]] std::optional<double> column_opt_double(int col) const;
  [[nodiscard]] std::optional<std::string> column_opt_text(int col) const;

private:
  sqlite3* db_{nullptr};
  sqlite3_stmt* stmt_{nullptr};
};

// One SQLite connection with the sampler schema and pragmas applied:
// WAL journal, synchronous=NORMAL, foreign keys on, busy timeout.
class Database {
public:
  static constexpr int kBusyTimeoutMs = 5000;

  explicit Database(const std::string& path, int busy_timeout_ms = kBusyTimeoutMs);
  ~Database();
  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  void exec(const char* sql);
  [[nodiscard]] Statement prepare(std::string_view sql);
  [[nodiscard]] int64_t changes() const;
  [[nodiscard]] std::string journal_mode();
  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] sqlite3* handle() const { return db_; }

private:
  void init_schema();
  sqlite3* db_{nullptr};
  std::string path_;
};

// BEGIN IMMEDIATE on construction; ROLLBACK on destruction unless commit()
// succeeded. IMMEDIATE takes the write lock up front so busy errors surface
// before any row is written.
class Transaction {
public:
  explicit Transaction(Database& db);
  ~Transaction();
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  void commit();
private:
  Database& db_;
  bool done_{false};
};

} // namespace proctally::store
