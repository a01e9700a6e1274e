#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/api/codec.hpp"
#include "internal/util/json.hpp"

namespace ingest::db::sqlite {

using ingest::db::ErrorCode;
using ingest::db::Result;

namespace {

constexpr const char* kSessionColumns =
    "id,owner_id,filename,mime_type,total_size,chunk_size,total_chunks,uploaded_chunks,uploaded_size,status,temp_path,metadata,"
    "expires_at_ms,created_at_ms,updated_at_ms";

constexpr const char* kFileColumns =
    "id,owner_id,original_name,generated_filename,mime_type,type_category,size_bytes,content_hash,primary_provider,primary_url,"
    "primary_object_id,backup_provider,backup_url,backup_object_id,category,privacy,status,metadata,created_at_ms,updated_at_ms,"
    "deleted_at_ms";

constexpr const char* kVariantColumns = "id,file_id,kind,url,width,height,size_bytes,format,metadata,created_at_ms";

constexpr const char* kJobColumns =
    "id,queue,kind,payload,priority,attempts_made,max_attempts,backoff_initial_ms,state,available_at_ms,last_error,created_at_ms,"
    "updated_at_ms,error_code";

/*
  Prepared statement that finalizes itself.
*/
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return st_ != nullptr;
  }

  sqlite3_stmt* get() const {
    return st_;
  }

  // Throws on prepare failure; used by read paths that return records.
  sqlite3_stmt* Require() const {
    if (!st_) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
    return st_;
  }

  // SQLITE_ROW or SQLITE_DONE; anything else throws.
  int StepRow() {
    int rc = sqlite3_step(st_);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
      throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db_));
    }
    return rc;
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

template <typename T>
void BindOptional(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
  if (v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*v));
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const auto* data = static_cast<const char*>(sqlite3_column_blob(st, col));
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(data, static_cast<std::size_t>(size)) : std::string();
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

template <typename T>
std::optional<T> ColOptional(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return static_cast<T>(sqlite3_column_int64(st, col));
}

void BindSession(sqlite3_stmt* st, const model::SessionRecord& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.owner_id);
  BindText(st, 3, r.filename);
  BindText(st, 4, r.mime_type);
  BindU64(st, 5, r.total_size);
  BindU64(st, 6, r.chunk_size);
  BindU64(st, 7, r.total_chunks);
  BindText(st, 8, EncodeChunkSet(r.uploaded_chunks));
  BindU64(st, 9, r.uploaded_size);
  BindI32(st, 10, static_cast<int>(r.status));
  BindText(st, 11, r.temp_path);
  BindText(st, 12, util::EncodeStringMap(r.metadata));
  BindU64(st, 13, r.expires_at_ms);
  BindU64(st, 14, r.created_at_ms);
  BindU64(st, 15, r.updated_at_ms);
}

model::SessionRecord ReadSession(sqlite3_stmt* st) {
  model::SessionRecord r;
  r.id              = ColText(st, 0);
  r.owner_id        = ColText(st, 1);
  r.filename        = ColText(st, 2);
  r.mime_type       = ColText(st, 3);
  r.total_size      = ColU64(st, 4);
  r.chunk_size      = ColU64(st, 5);
  r.total_chunks    = ColU64(st, 6);
  r.uploaded_chunks = DecodeChunkSet(ColText(st, 7));
  r.uploaded_size   = ColU64(st, 8);
  r.status          = static_cast<ingest::model::SessionStatus>(ColI32(st, 9));
  r.temp_path       = ColText(st, 10);
  r.metadata        = util::DecodeStringMap(ColText(st, 11));
  r.expires_at_ms   = ColU64(st, 12);
  r.created_at_ms   = ColU64(st, 13);
  r.updated_at_ms   = ColU64(st, 14);
  return r;
}

void BindFile(sqlite3_stmt* st, const model::FileRecord& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.owner_id);
  BindText(st, 3, r.original_name);
  BindText(st, 4, r.generated_filename);
  BindText(st, 5, r.mime_type);
  BindI32(st, 6, static_cast<int>(r.type_category));
  BindU64(st, 7, r.size_bytes);
  BindText(st, 8, r.content_hash);
  BindI32(st, 9, static_cast<int>(r.primary_provider));
  BindText(st, 10, r.primary_url);
  BindText(st, 11, r.primary_object_id);
  BindI32(st, 12, static_cast<int>(r.backup_provider));
  BindText(st, 13, r.backup_url);
  BindText(st, 14, r.backup_object_id);
  BindI32(st, 15, static_cast<int>(r.category));
  BindI32(st, 16, static_cast<int>(r.privacy));
  BindI32(st, 17, static_cast<int>(r.status));
  BindText(st, 18, util::EncodeStringMap(r.metadata));
  BindU64(st, 19, r.created_at_ms);
  BindU64(st, 20, r.updated_at_ms);
  BindOptional(st, 21, r.deleted_at_ms);
}

model::FileRecord ReadFile(sqlite3_stmt* st) {
  model::FileRecord r;
  r.id                 = ColText(st, 0);
  r.owner_id           = ColText(st, 1);
  r.original_name      = ColText(st, 2);
  r.generated_filename = ColText(st, 3);
  r.mime_type          = ColText(st, 4);
  r.type_category      = static_cast<ingest::model::TypeCategory>(ColI32(st, 5));
  r.size_bytes         = ColU64(st, 6);
  r.content_hash       = ColText(st, 7);
  r.primary_provider   = static_cast<ingest::model::ProviderKind>(ColI32(st, 8));
  r.primary_url        = ColText(st, 9);
  r.primary_object_id  = ColText(st, 10);
  r.backup_provider    = static_cast<ingest::model::ProviderKind>(ColI32(st, 11));
  r.backup_url         = ColText(st, 12);
  r.backup_object_id   = ColText(st, 13);
  r.category           = static_cast<ingest::model::FileCategory>(ColI32(st, 14));
  r.privacy            = static_cast<ingest::model::Privacy>(ColI32(st, 15));
  r.status             = static_cast<ingest::model::FileStatus>(ColI32(st, 16));
  r.metadata           = util::DecodeStringMap(ColText(st, 17));
  r.created_at_ms      = ColU64(st, 18);
  r.updated_at_ms      = ColU64(st, 19);
  r.deleted_at_ms      = ColOptional<uint64_t>(st, 20);
  return r;
}

model::VariantRecord ReadVariant(sqlite3_stmt* st) {
  model::VariantRecord r;
  r.id            = ColText(st, 0);
  r.file_id       = ColText(st, 1);
  r.kind          = static_cast<ingest::model::VariantKind>(ColI32(st, 2));
  r.url           = ColText(st, 3);
  r.width         = ColOptional<uint32_t>(st, 4);
  r.height        = ColOptional<uint32_t>(st, 5);
  r.size_bytes    = ColU64(st, 6);
  r.format        = ColText(st, 7);
  r.metadata      = util::DecodeStringMap(ColText(st, 8));
  r.created_at_ms = ColU64(st, 9);
  return r;
}

model::JobRecord ReadJob(sqlite3_stmt* st) {
  model::JobRecord r;
  r.id                 = ColText(st, 0);
  r.queue              = ColText(st, 1);
  r.kind               = ColText(st, 2);
  r.payload            = ColBlob(st, 3);
  r.priority           = ColI32(st, 4);
  r.attempts_made      = static_cast<uint32_t>(ColU64(st, 5));
  r.max_attempts       = static_cast<uint32_t>(ColU64(st, 6));
  r.backoff_initial_ms = ColU64(st, 7);
  r.state              = static_cast<model::JobState>(ColI32(st, 8));
  r.available_at_ms    = ColU64(st, 9);
  r.last_error         = ColText(st, 10);
  r.created_at_ms      = ColU64(st, 11);
  r.updated_at_ms      = ColU64(st, 12);
  r.error_code         = ColText(st, 13);
  return r;
}

template <typename Record, typename Reader>
std::vector<Record> ReadAll(Statement& stmt, Reader reader) {
  std::vector<Record> out;
  while (stmt.StepRow() == SQLITE_ROW) {
    out.push_back(reader(stmt.get()));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("INSERT INTO upload_session(") + kSessionColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindSession(stmt.get(), r);
  return Translate(db, sqlite3_step(stmt.get()));
}

std::optional<model::SessionRecord> SqliteRepository::GetSession(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("SELECT ") + kSessionColumns + " FROM upload_session WHERE id=?;");
  BindText(stmt.Require(), 1, id);

  if (stmt.StepRow() != SQLITE_ROW) return std::nullopt;
  return ReadSession(stmt.get());
}

Result SqliteRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
  auto* db = TX(t).Handle();

  // ?1 is the id; numbered parameters reuse BindSession.
  Statement stmt(db,
                 "UPDATE upload_session SET owner_id=?2,filename=?3,mime_type=?4,total_size=?5,chunk_size=?6,total_chunks=?7,"
                 "uploaded_chunks=?8,uploaded_size=?9,status=?10,temp_path=?11,metadata=?12,expires_at_ms=?13,created_at_ms=?14,"
                 "updated_at_ms=?15 WHERE id=?1;");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindSession(stmt.get(), r);
  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

Result SqliteRepository::DeleteSession(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement stmt(db, "DELETE FROM upload_session WHERE id=?;");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(stmt.get(), 1, id);
  return Translate(db, sqlite3_step(stmt.get()));
}

std::vector<model::SessionRecord> SqliteRepository::ListExpiredSessions(Transaction& t, uint64_t now_ms) {
  Statement stmt(TX(t).Handle(), std::string("SELECT ") + kSessionColumns + " FROM upload_session WHERE status=? AND expires_at_ms<?;");
  BindI32(stmt.Require(), 1, static_cast<int>(ingest::model::SessionStatus::kActive));
  BindU64(stmt.get(), 2, now_ms);
  return ReadAll<model::SessionRecord>(stmt, ReadSession);
}

std::vector<model::SessionRecord> SqliteRepository::ListStaleSessions(Transaction& t, uint64_t cutoff_ms) {
  Statement stmt(TX(t).Handle(), std::string("SELECT ") + kSessionColumns + " FROM upload_session WHERE status<>? AND expires_at_ms<?;");
  BindI32(stmt.Require(), 1, static_cast<int>(ingest::model::SessionStatus::kActive));
  BindU64(stmt.get(), 2, cutoff_ms);
  return ReadAll<model::SessionRecord>(stmt, ReadSession);
}

// ------------------------------------------------------------------
// Files
// ------------------------------------------------------------------

Result SqliteRepository::InsertFile(Transaction& t, const model::FileRecord& r) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("INSERT INTO ingest_file(") + kFileColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindFile(stmt.get(), r);
  return Translate(db, sqlite3_step(stmt.get()));
}

std::optional<model::FileRecord> SqliteRepository::GetFile(Transaction& t, const std::string& id) {
  Statement stmt(TX(t).Handle(), std::string("SELECT ") + kFileColumns + " FROM ingest_file WHERE id=?;");
  BindText(stmt.Require(), 1, id);

  if (stmt.StepRow() != SQLITE_ROW) return std::nullopt;
  return ReadFile(stmt.get());
}

Result SqliteRepository::UpdateFile(Transaction& t, const model::FileRecord& r) {
  auto* db = TX(t).Handle();

  Statement stmt(db,
                 "UPDATE ingest_file SET owner_id=?2,original_name=?3,generated_filename=?4,mime_type=?5,type_category=?6,size_bytes=?7,"
                 "content_hash=?8,primary_provider=?9,primary_url=?10,primary_object_id=?11,backup_provider=?12,backup_url=?13,"
                 "backup_object_id=?14,category=?15,privacy=?16,status=?17,metadata=?18,created_at_ms=?19,updated_at_ms=?20,"
                 "deleted_at_ms=?21 WHERE id=?1;");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindFile(stmt.get(), r);
  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

std::vector<model::FileRecord> SqliteRepository::FindFilesByHash(Transaction& t, const std::string& owner_id,
                                                                 const std::string& content_hash) {
  Statement stmt(TX(t).Handle(), std::string("SELECT ") + kFileColumns +
                                     " FROM ingest_file WHERE owner_id=? AND content_hash=? AND status<>? ORDER BY created_at_ms ASC;");
  BindText(stmt.Require(), 1, owner_id);
  BindText(stmt.get(), 2, content_hash);
  BindI32(stmt.get(), 3, static_cast<int>(ingest::model::FileStatus::kDeleted));
  return ReadAll<model::FileRecord>(stmt, ReadFile);
}

std::vector<model::FileRecord> SqliteRepository::ListFiles(Transaction& t, const FileFilter& filter, const Page& page) {
  std::string sql = std::string("SELECT ") + kFileColumns + " FROM ingest_file WHERE owner_id=?1";
  if (!filter.include_deleted) sql += " AND status<>?2";
  if (filter.status) sql += " AND status=?3";
  if (filter.type_category) sql += " AND type_category=?4";
  if (filter.category) sql += " AND category=?5";
  sql += " ORDER BY created_at_ms DESC, id ASC LIMIT ?6 OFFSET ?7;";

  Statement stmt(TX(t).Handle(), sql);
  auto*     st = stmt.Require();
  BindText(st, 1, filter.owner_id);
  BindI32(st, 2, static_cast<int>(ingest::model::FileStatus::kDeleted));
  if (filter.status) BindI32(st, 3, static_cast<int>(*filter.status));
  if (filter.type_category) BindI32(st, 4, static_cast<int>(*filter.type_category));
  if (filter.category) BindI32(st, 5, static_cast<int>(*filter.category));
  BindU64(st, 6, page.limit);
  BindU64(st, 7, page.offset);
  return ReadAll<model::FileRecord>(stmt, ReadFile);
}

// ------------------------------------------------------------------
// Variants
// ------------------------------------------------------------------

Result SqliteRepository::UpsertVariant(Transaction& t, const model::VariantRecord& r) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("INSERT INTO file_variant(") + kVariantColumns +
                         ") VALUES(?,?,?,?,?,?,?,?,?,?) "
                         "ON CONFLICT(file_id,kind) DO UPDATE SET url=excluded.url,width=excluded.width,height=excluded.height,"
                         "size_bytes=excluded.size_bytes,format=excluded.format,metadata=excluded.metadata;");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* st = stmt.get();
  BindText(st, 1, r.id);
  BindText(st, 2, r.file_id);
  BindI32(st, 3, static_cast<int>(r.kind));
  BindText(st, 4, r.url);
  BindOptional(st, 5, r.width);
  BindOptional(st, 6, r.height);
  BindU64(st, 7, r.size_bytes);
  BindText(st, 8, r.format);
  BindText(st, 9, util::EncodeStringMap(r.metadata));
  BindU64(st, 10, r.created_at_ms);
  return Translate(db, sqlite3_step(st));
}

std::vector<model::VariantRecord> SqliteRepository::ListVariants(Transaction& t, const std::string& file_id) {
  Statement stmt(TX(t).Handle(), std::string("SELECT ") + kVariantColumns + " FROM file_variant WHERE file_id=? ORDER BY kind ASC;");
  BindText(stmt.Require(), 1, file_id);
  return ReadAll<model::VariantRecord>(stmt, ReadVariant);
}

Result SqliteRepository::DeleteVariants(Transaction& t, const std::string& file_id) {
  auto* db = TX(t).Handle();

  Statement stmt(db, "DELETE FROM file_variant WHERE file_id=?;");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(stmt.get(), 1, file_id);
  return Translate(db, sqlite3_step(stmt.get()));
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::UpsertJob(Transaction& t, const model::JobRecord& r) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("INSERT INTO ingest_job(") + kJobColumns +
                         ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
                         "ON CONFLICT(id) DO UPDATE SET queue=excluded.queue,kind=excluded.kind,payload=excluded.payload,"
                         "priority=excluded.priority,attempts_made=excluded.attempts_made,max_attempts=excluded.max_attempts,"
                         "backoff_initial_ms=excluded.backoff_initial_ms,state=excluded.state,available_at_ms=excluded.available_at_ms,"
                         "last_error=excluded.last_error,updated_at_ms=excluded.updated_at_ms,error_code=excluded.error_code;");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* st = stmt.get();
  BindText(st, 1, r.id);
  BindText(st, 2, r.queue);
  BindText(st, 3, r.kind);
  BindBlob(st, 4, r.payload);
  BindI32(st, 5, r.priority);
  BindU64(st, 6, r.attempts_made);
  BindU64(st, 7, r.max_attempts);
  BindU64(st, 8, r.backoff_initial_ms);
  BindI32(st, 9, static_cast<int>(r.state));
  BindU64(st, 10, r.available_at_ms);
  BindText(st, 11, r.last_error);
  BindU64(st, 12, r.created_at_ms);
  BindU64(st, 13, r.updated_at_ms);
  BindText(st, 14, r.error_code);
  return Translate(db, sqlite3_step(st));
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& id) {
  Statement stmt(TX(t).Handle(), std::string("SELECT ") + kJobColumns + " FROM ingest_job WHERE id=?;");
  BindText(stmt.Require(), 1, id);

  if (stmt.StepRow() != SQLITE_ROW) return std::nullopt;
  return ReadJob(stmt.get());
}

std::vector<model::JobRecord> SqliteRepository::ListJobs(Transaction& t, const std::string& queue) {
  Statement stmt(TX(t).Handle(), std::string("SELECT ") + kJobColumns + " FROM ingest_job WHERE queue=? ORDER BY priority ASC, created_at_ms ASC;");
  BindText(stmt.Require(), 1, queue);
  return ReadAll<model::JobRecord>(stmt, ReadJob);
}

Result SqliteRepository::DeleteJob(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement stmt(db, "DELETE FROM ingest_job WHERE id=?;");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(stmt.get(), 1, id);
  return Translate(db, sqlite3_step(stmt.get()));
}

} // namespace ingest::db::sqlite
