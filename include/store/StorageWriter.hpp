#pragma once
#include "model/Process.hpp"
#include "store/Database.hpp"
#include <cstdint>
#include <optional>

namespace proctally::store {

struct CommitStats {
  size_t sessions{};
  size_t samples{};
  size_t ended{};
};

// Persists one tick (session upserts, samples, ended marks) as a single
// transaction. Throws StoreError; on throw nothing from the tick is visible.
class StorageWriter {
public:
  explicit StorageWriter(Database& db);

  CommitStats commit(const proctally::model::TickBatch& batch);

  // Row id of a session, if persisted.
  [[nodiscard]] std::optional<int64_t> session_id(const proctally::model::SessionKey& key);

private:
  int64_t upsert_session(const proctally::model::SessionInfo& s);

  Database& db_;
  Statement upsert_;
  Statement select_id_;
  Statement insert_sample_;
  Statement mark_ended_;
};

} // namespace proctally::store
