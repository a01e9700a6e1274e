#include "pg_pool.hpp"

namespace ingest::db::postgres {

namespace {

constexpr const char* kSessionColumns =
    "id,owner_id,filename,mime_type,total_size,chunk_size,total_chunks,uploaded_chunks,uploaded_size,status,temp_path,metadata::text,"
    "expires_at_ms,created_at_ms,updated_at_ms";

constexpr const char* kFileColumns =
    "id,owner_id,original_name,generated_filename,mime_type,type_category,size_bytes,content_hash,primary_provider,primary_url,"
    "primary_object_id,backup_provider,backup_url,backup_object_id,category,privacy,status,metadata::text,created_at_ms,updated_at_ms,"
    "deleted_at_ms";

constexpr const char* kVariantColumns = "id,file_id,kind,url,width,height,size_bytes,format,metadata::text,created_at_ms";

constexpr const char* kJobColumns =
    "id,queue,kind,payload,priority,attempts_made,max_attempts,backoff_initial_ms,state,available_at_ms,last_error,created_at_ms,"
    "updated_at_ms,error_code";

std::string Select(const char* columns, const std::string& rest) {
  return std::string("SELECT ") + columns + " " + rest;
}

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // Sessions
  conn.prepare("insert_session",
               "INSERT INTO upload_session(id,owner_id,filename,mime_type,total_size,chunk_size,total_chunks,uploaded_chunks,uploaded_size,"
               "status,temp_path,metadata,expires_at_ms,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12::jsonb,$13,$14,$15)");
  conn.prepare("get_session", Select(kSessionColumns, "FROM upload_session WHERE id=$1"));
  conn.prepare("update_session",
               "UPDATE upload_session SET owner_id=$2,filename=$3,mime_type=$4,total_size=$5,chunk_size=$6,total_chunks=$7,"
               "uploaded_chunks=$8,uploaded_size=$9,status=$10,temp_path=$11,metadata=$12::jsonb,expires_at_ms=$13,created_at_ms=$14,"
               "updated_at_ms=$15 WHERE id=$1");
  conn.prepare("delete_session", "DELETE FROM upload_session WHERE id=$1");
  conn.prepare("list_expired_sessions", Select(kSessionColumns, "FROM upload_session WHERE status=$1 AND expires_at_ms<$2"));
  conn.prepare("list_stale_sessions", Select(kSessionColumns, "FROM upload_session WHERE status<>$1 AND expires_at_ms<$2"));

  // Files
  conn.prepare("insert_file",
               "INSERT INTO ingest_file(id,owner_id,original_name,generated_filename,mime_type,type_category,size_bytes,content_hash,"
               "primary_provider,primary_url,primary_object_id,backup_provider,backup_url,backup_object_id,category,privacy,status,metadata,"
               "created_at_ms,updated_at_ms,deleted_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18::jsonb,$19,$20,$21)");
  conn.prepare("get_file", Select(kFileColumns, "FROM ingest_file WHERE id=$1"));
  conn.prepare("update_file",
               "UPDATE ingest_file SET owner_id=$2,original_name=$3,generated_filename=$4,mime_type=$5,type_category=$6,size_bytes=$7,"
               "content_hash=$8,primary_provider=$9,primary_url=$10,primary_object_id=$11,backup_provider=$12,backup_url=$13,"
               "backup_object_id=$14,category=$15,privacy=$16,status=$17,metadata=$18::jsonb,created_at_ms=$19,updated_at_ms=$20,"
               "deleted_at_ms=$21 WHERE id=$1");
  conn.prepare("find_files_by_hash",
               Select(kFileColumns, "FROM ingest_file WHERE owner_id=$1 AND content_hash=$2 AND status<>$3 ORDER BY created_at_ms ASC"));
  conn.prepare("list_files", Select(kFileColumns,
                                    "FROM ingest_file WHERE owner_id=$1 AND ($2 OR status<>$3) "
                                    "AND ($4::smallint IS NULL OR status=$4) AND ($5::smallint IS NULL OR type_category=$5) "
                                    "AND ($6::smallint IS NULL OR category=$6) "
                                    "ORDER BY created_at_ms DESC, id ASC LIMIT $7 OFFSET $8"));

  // Variants
  conn.prepare("upsert_variant",
               "INSERT INTO file_variant(id,file_id,kind,url,width,height,size_bytes,format,metadata,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9::jsonb,$10) "
               "ON CONFLICT(file_id,kind) DO UPDATE SET url=EXCLUDED.url,width=EXCLUDED.width,height=EXCLUDED.height,"
               "size_bytes=EXCLUDED.size_bytes,format=EXCLUDED.format,metadata=EXCLUDED.metadata");
  conn.prepare("list_variants", Select(kVariantColumns, "FROM file_variant WHERE file_id=$1 ORDER BY kind ASC"));
  conn.prepare("delete_variants", "DELETE FROM file_variant WHERE file_id=$1");

  // Jobs
  conn.prepare("upsert_job",
               "INSERT INTO ingest_job(id,queue,kind,payload,priority,attempts_made,max_attempts,backoff_initial_ms,state,available_at_ms,"
               "last_error,created_at_ms,updated_at_ms,error_code) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14) "
               "ON CONFLICT(id) DO UPDATE SET queue=EXCLUDED.queue,kind=EXCLUDED.kind,payload=EXCLUDED.payload,priority=EXCLUDED.priority,"
               "attempts_made=EXCLUDED.attempts_made,max_attempts=EXCLUDED.max_attempts,backoff_initial_ms=EXCLUDED.backoff_initial_ms,"
               "state=EXCLUDED.state,available_at_ms=EXCLUDED.available_at_ms,last_error=EXCLUDED.last_error,"
               "updated_at_ms=EXCLUDED.updated_at_ms,error_code=EXCLUDED.error_code");
  conn.prepare("get_job", Select(kJobColumns, "FROM ingest_job WHERE id=$1"));
  conn.prepare("list_jobs", Select(kJobColumns, "FROM ingest_job WHERE queue=$1 ORDER BY priority ASC, created_at_ms ASC"));
  conn.prepare("delete_job", "DELETE FROM ingest_job WHERE id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (!conn->is_open()) {
      --live_connections_;
      delete conn;
      cv_.notify_one();
      return;
    }
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace ingest::db::postgres
