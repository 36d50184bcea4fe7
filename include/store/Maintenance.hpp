#pragma once
#include "store/Database.hpp"

namespace proctally::store {

// VACUUM the database file.
void vacuum(Database& db);

// Delete every sample and session in one transaction, then VACUUM.
void reset(Database& db);

} // namespace proctally::store
