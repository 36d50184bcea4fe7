#include "store/Maintenance.hpp"
#include "util/Log.hpp"

namespace proctally::store {

void vacuum(Database& db) {
  db.exec("VACUUM");
  proctally::util::log_debug("store", "vacuumed %s", db.path().c_str());
}

void reset(Database& db) {
  {
    Transaction tx(db);
    db.exec("DELETE FROM sample");
    db.exec("DELETE FROM process");
    tx.commit();
  }
  vacuum(db);
}

} // namespace proctally::store
