#include "pg_schema.hpp"

namespace ingest::db::postgres {

void BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec(
      "CREATE TABLE IF NOT EXISTS upload_session (id TEXT PRIMARY KEY, owner_id TEXT NOT NULL, filename TEXT NOT NULL, mime_type TEXT NOT NULL, "
      "total_size BIGINT NOT NULL, chunk_size BIGINT NOT NULL, total_chunks BIGINT NOT NULL, uploaded_chunks TEXT NOT NULL, "
      "uploaded_size BIGINT NOT NULL, status SMALLINT NOT NULL, temp_path TEXT NOT NULL, metadata JSONB NOT NULL, expires_at_ms BIGINT NOT NULL, "
      "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS upload_session_expiry ON upload_session(status, expires_at_ms);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS ingest_file (id TEXT PRIMARY KEY, owner_id TEXT NOT NULL, original_name TEXT NOT NULL, "
      "generated_filename TEXT NOT NULL, mime_type TEXT NOT NULL, type_category SMALLINT NOT NULL, size_bytes BIGINT NOT NULL, "
      "content_hash TEXT NOT NULL, primary_provider SMALLINT NOT NULL, primary_url TEXT NOT NULL, primary_object_id TEXT NOT NULL, "
      "backup_provider SMALLINT NOT NULL, backup_url TEXT NOT NULL, backup_object_id TEXT NOT NULL, category SMALLINT NOT NULL, "
      "privacy SMALLINT NOT NULL, status SMALLINT NOT NULL, metadata JSONB NOT NULL, created_at_ms BIGINT NOT NULL, "
      "updated_at_ms BIGINT NOT NULL, deleted_at_ms BIGINT);");
  tx.exec("CREATE INDEX IF NOT EXISTS ingest_file_owner_hash ON ingest_file(owner_id, content_hash);");
  tx.exec("CREATE INDEX IF NOT EXISTS ingest_file_owner_created ON ingest_file(owner_id, created_at_ms);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS file_variant (id TEXT PRIMARY KEY, file_id TEXT NOT NULL REFERENCES ingest_file(id) ON DELETE CASCADE, "
      "kind SMALLINT NOT NULL, url TEXT NOT NULL, width INTEGER, height INTEGER, size_bytes BIGINT NOT NULL, format TEXT NOT NULL, "
      "metadata JSONB NOT NULL, created_at_ms BIGINT NOT NULL, UNIQUE(file_id, kind));");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS ingest_job (id TEXT PRIMARY KEY, queue TEXT NOT NULL, kind TEXT NOT NULL, payload TEXT NOT NULL, "
      "priority INTEGER NOT NULL, attempts_made INTEGER NOT NULL, max_attempts INTEGER NOT NULL, backoff_initial_ms BIGINT NOT NULL, "
      "state SMALLINT NOT NULL, available_at_ms BIGINT NOT NULL, last_error TEXT NOT NULL, created_at_ms BIGINT NOT NULL, "
      "updated_at_ms BIGINT NOT NULL, error_code TEXT NOT NULL DEFAULT '');");
  tx.exec("CREATE INDEX IF NOT EXISTS ingest_job_queue ON ingest_job(queue, priority, created_at_ms);");

  tx.exec("SELECT id,status,expires_at_ms FROM upload_session LIMIT 1;");
  tx.exec("SELECT id,owner_id,content_hash,status FROM ingest_file LIMIT 1;");
  tx.exec("SELECT id,file_id,kind FROM file_variant LIMIT 1;");
  tx.exec("SELECT id,queue,state FROM ingest_job LIMIT 1;");
  tx.commit();
}

} // namespace ingest::db::postgres
