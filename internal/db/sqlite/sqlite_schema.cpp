#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace ingest::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS upload_session (id TEXT PRIMARY KEY, owner_id TEXT NOT NULL, filename TEXT NOT NULL, mime_type TEXT NOT NULL, "
      "total_size INTEGER NOT NULL, chunk_size INTEGER NOT NULL, total_chunks INTEGER NOT NULL, uploaded_chunks TEXT NOT NULL, "
      "uploaded_size INTEGER NOT NULL, status INTEGER NOT NULL, temp_path TEXT NOT NULL, metadata TEXT NOT NULL, expires_at_ms INTEGER NOT NULL, "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS upload_session_expiry ON upload_session(status, expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS ingest_file (id TEXT PRIMARY KEY, owner_id TEXT NOT NULL, original_name TEXT NOT NULL, "
      "generated_filename TEXT NOT NULL, mime_type TEXT NOT NULL, type_category INTEGER NOT NULL, size_bytes INTEGER NOT NULL, "
      "content_hash TEXT NOT NULL, primary_provider INTEGER NOT NULL, primary_url TEXT NOT NULL, primary_object_id TEXT NOT NULL, "
      "backup_provider INTEGER NOT NULL, backup_url TEXT NOT NULL, backup_object_id TEXT NOT NULL, category INTEGER NOT NULL, "
      "privacy INTEGER NOT NULL, status INTEGER NOT NULL, metadata TEXT NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, "
      "deleted_at_ms INTEGER);",
      "CREATE INDEX IF NOT EXISTS ingest_file_owner_hash ON ingest_file(owner_id, content_hash);",
      "CREATE INDEX IF NOT EXISTS ingest_file_owner_created ON ingest_file(owner_id, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS file_variant (id TEXT PRIMARY KEY, file_id TEXT NOT NULL REFERENCES ingest_file(id) ON DELETE CASCADE, "
      "kind INTEGER NOT NULL, url TEXT NOT NULL, width INTEGER, height INTEGER, size_bytes INTEGER NOT NULL, format TEXT NOT NULL, "
      "metadata TEXT NOT NULL, created_at_ms INTEGER NOT NULL, UNIQUE(file_id, kind));",
      "CREATE TABLE IF NOT EXISTS ingest_job (id TEXT PRIMARY KEY, queue TEXT NOT NULL, kind TEXT NOT NULL, payload BLOB NOT NULL, "
      "priority INTEGER NOT NULL, attempts_made INTEGER NOT NULL, max_attempts INTEGER NOT NULL, backoff_initial_ms INTEGER NOT NULL, "
      "state INTEGER NOT NULL, available_at_ms INTEGER NOT NULL, last_error TEXT NOT NULL, created_at_ms INTEGER NOT NULL, "
      "updated_at_ms INTEGER NOT NULL, error_code TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS ingest_job_queue ON ingest_job(queue, priority, created_at_ms);",
  };

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT id,status,expires_at_ms FROM upload_session LIMIT 1;");
  db.Exec("SELECT id,owner_id,content_hash,status FROM ingest_file LIMIT 1;");
  db.Exec("SELECT id,file_id,kind FROM file_variant LIMIT 1;");
  db.Exec("SELECT id,queue,state FROM ingest_job LIMIT 1;");
}

} // namespace ingest::db::sqlite
