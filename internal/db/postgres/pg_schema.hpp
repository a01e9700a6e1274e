#pragma once

#include "pg_pool.hpp"

namespace ingest::db::postgres {

// Idempotent CREATE TABLE / INDEX for all ingest tables.
void BootstrapSchema(PgPool& pool);

} // namespace ingest::db::postgres
