#pragma once

#include "sqlite_db.hpp"

namespace resync::db::sqlite {

// Creates every table the repository reads and records the schema version.
// Safe to run on every start.
void BootstrapSchema(SqliteDB& db);

} // namespace resync::db::sqlite
