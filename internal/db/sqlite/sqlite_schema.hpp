#pragma once

#include "sqlite_db.hpp"

namespace ingest::db::sqlite {

// Creates tables and indexes if missing. Safe to run on every start.
void BootstrapSchema(SqliteDB& db);

} // namespace ingest::db::sqlite
