#include "pg_repository.hpp"

#include "internal/db/api/codec.hpp"
#include "internal/util/encoding.hpp"
#include "internal/util/json.hpp"

namespace ingest::db::postgres {

namespace {

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

template <typename T>
std::optional<T> Nullable(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return static_cast<T>(f.as<int64_t>());
}

uint64_t U64(const pqxx::field& f) {
  return static_cast<uint64_t>(f.as<int64_t>());
}

int64_t I64(uint64_t v) {
  return static_cast<int64_t>(v);
}

std::optional<int64_t> I64(const std::optional<uint64_t>& v) {
  if (!v) return std::nullopt;
  return static_cast<int64_t>(*v);
}

std::optional<int64_t> I64(const std::optional<uint32_t>& v) {
  if (!v) return std::nullopt;
  return static_cast<int64_t>(*v);
}

model::SessionRecord ReadSession(const pqxx::row& row) {
  model::SessionRecord r;
  r.id              = row[0].c_str();
  r.owner_id        = row[1].c_str();
  r.filename        = row[2].c_str();
  r.mime_type       = row[3].c_str();
  r.total_size      = U64(row[4]);
  r.chunk_size      = U64(row[5]);
  r.total_chunks    = U64(row[6]);
  r.uploaded_chunks = DecodeChunkSet(Text(row[7]));
  r.uploaded_size   = U64(row[8]);
  r.status          = static_cast<ingest::model::SessionStatus>(row[9].as<int>());
  r.temp_path       = Text(row[10]);
  r.metadata        = util::DecodeStringMap(Text(row[11]));
  r.expires_at_ms   = U64(row[12]);
  r.created_at_ms   = U64(row[13]);
  r.updated_at_ms   = U64(row[14]);
  return r;
}

model::FileRecord ReadFile(const pqxx::row& row) {
  model::FileRecord r;
  r.id                 = row[0].c_str();
  r.owner_id           = row[1].c_str();
  r.original_name      = Text(row[2]);
  r.generated_filename = Text(row[3]);
  r.mime_type          = Text(row[4]);
  r.type_category      = static_cast<ingest::model::TypeCategory>(row[5].as<int>());
  r.size_bytes         = U64(row[6]);
  r.content_hash       = Text(row[7]);
  r.primary_provider   = static_cast<ingest::model::ProviderKind>(row[8].as<int>());
  r.primary_url        = Text(row[9]);
  r.primary_object_id  = Text(row[10]);
  r.backup_provider    = static_cast<ingest::model::ProviderKind>(row[11].as<int>());
  r.backup_url         = Text(row[12]);
  r.backup_object_id   = Text(row[13]);
  r.category           = static_cast<ingest::model::FileCategory>(row[14].as<int>());
  r.privacy            = static_cast<ingest::model::Privacy>(row[15].as<int>());
  r.status             = static_cast<ingest::model::FileStatus>(row[16].as<int>());
  r.metadata           = util::DecodeStringMap(Text(row[17]));
  r.created_at_ms      = U64(row[18]);
  r.updated_at_ms      = U64(row[19]);
  r.deleted_at_ms      = Nullable<uint64_t>(row[20]);
  return r;
}

model::VariantRecord ReadVariant(const pqxx::row& row) {
  model::VariantRecord r;
  r.id            = row[0].c_str();
  r.file_id       = row[1].c_str();
  r.kind          = static_cast<ingest::model::VariantKind>(row[2].as<int>());
  r.url           = Text(row[3]);
  r.width         = Nullable<uint32_t>(row[4]);
  r.height        = Nullable<uint32_t>(row[5]);
  r.size_bytes    = U64(row[6]);
  r.format        = Text(row[7]);
  r.metadata      = util::DecodeStringMap(Text(row[8]));
  r.created_at_ms = U64(row[9]);
  return r;
}

// payload is stored hex-encoded in a TEXT column.
model::JobRecord ReadJob(const pqxx::row& row) {
  model::JobRecord r;
  r.id                 = row[0].c_str();
  r.queue              = row[1].c_str();
  r.kind               = row[2].c_str();
  r.payload            = util::HexDecode(Text(row[3]));
  r.priority           = row[4].as<int>();
  r.attempts_made      = static_cast<uint32_t>(row[5].as<int64_t>());
  r.max_attempts       = static_cast<uint32_t>(row[6].as<int64_t>());
  r.backoff_initial_ms = U64(row[7]);
  r.state              = static_cast<model::JobState>(row[8].as<int>());
  r.available_at_ms    = U64(row[9]);
  r.last_error         = Text(row[10]);
  r.created_at_ms      = U64(row[11]);
  r.updated_at_ms      = U64(row[12]);
  r.error_code         = Text(row[13]);
  return r;
}

template <typename Record, typename Reader>
std::vector<Record> ReadAll(const pqxx::result& res, Reader reader) {
  std::vector<Record> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(reader(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result PgRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_session", r.id, r.owner_id, r.filename, r.mime_type, I64(r.total_size), I64(r.chunk_size),
                               I64(r.total_chunks), EncodeChunkSet(r.uploaded_chunks), I64(r.uploaded_size), static_cast<int>(r.status),
                               r.temp_path, util::EncodeStringMap(r.metadata), I64(r.expires_at_ms), I64(r.created_at_ms),
                               I64(r.updated_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SessionRecord> PgRepository::GetSession(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_session", id);
  if (res.empty()) return std::nullopt;
  return ReadSession(res[0]);
}

Result PgRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_session", r.id, r.owner_id, r.filename, r.mime_type, I64(r.total_size),
                                          I64(r.chunk_size), I64(r.total_chunks), EncodeChunkSet(r.uploaded_chunks),
                                          I64(r.uploaded_size), static_cast<int>(r.status), r.temp_path,
                                          util::EncodeStringMap(r.metadata), I64(r.expires_at_ms), I64(r.created_at_ms),
                                          I64(r.updated_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteSession(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("delete_session", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SessionRecord> PgRepository::ListExpiredSessions(Transaction& t, uint64_t now_ms) {
  auto res = TX(t).Work().exec_prepared("list_expired_sessions", static_cast<int>(ingest::model::SessionStatus::kActive), I64(now_ms));
  return ReadAll<model::SessionRecord>(res, ReadSession);
}

std::vector<model::SessionRecord> PgRepository::ListStaleSessions(Transaction& t, uint64_t cutoff_ms) {
  auto res = TX(t).Work().exec_prepared("list_stale_sessions", static_cast<int>(ingest::model::SessionStatus::kActive), I64(cutoff_ms));
  return ReadAll<model::SessionRecord>(res, ReadSession);
}

// ------------------------------------------------------------------
// Files
// ------------------------------------------------------------------

Result PgRepository::InsertFile(Transaction& t, const model::FileRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_file", r.id, r.owner_id, r.original_name, r.generated_filename, r.mime_type,
                               static_cast<int>(r.type_category), I64(r.size_bytes), r.content_hash, static_cast<int>(r.primary_provider),
                               r.primary_url, r.primary_object_id, static_cast<int>(r.backup_provider), r.backup_url, r.backup_object_id,
                               static_cast<int>(r.category), static_cast<int>(r.privacy), static_cast<int>(r.status),
                               util::EncodeStringMap(r.metadata), I64(r.created_at_ms), I64(r.updated_at_ms), I64(r.deleted_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::FileRecord> PgRepository::GetFile(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_file", id);
  if (res.empty()) return std::nullopt;
  return ReadFile(res[0]);
}

Result PgRepository::UpdateFile(Transaction& t, const model::FileRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared(
        "update_file", r.id, r.owner_id, r.original_name, r.generated_filename, r.mime_type, static_cast<int>(r.type_category),
        I64(r.size_bytes), r.content_hash, static_cast<int>(r.primary_provider), r.primary_url, r.primary_object_id,
        static_cast<int>(r.backup_provider), r.backup_url, r.backup_object_id, static_cast<int>(r.category), static_cast<int>(r.privacy),
        static_cast<int>(r.status), util::EncodeStringMap(r.metadata), I64(r.created_at_ms), I64(r.updated_at_ms), I64(r.deleted_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::FileRecord> PgRepository::FindFilesByHash(Transaction& t, const std::string& owner_id, const std::string& content_hash) {
  auto res = TX(t).Work().exec_prepared("find_files_by_hash", owner_id, content_hash, static_cast<int>(ingest::model::FileStatus::kDeleted));
  return ReadAll<model::FileRecord>(res, ReadFile);
}

std::vector<model::FileRecord> PgRepository::ListFiles(Transaction& t, const FileFilter& filter, const Page& page) {
  std::optional<int> status;
  std::optional<int> type_category;
  std::optional<int> category;
  if (filter.status) status = static_cast<int>(*filter.status);
  if (filter.type_category) type_category = static_cast<int>(*filter.type_category);
  if (filter.category) category = static_cast<int>(*filter.category);

  auto res = TX(t).Work().exec_prepared("list_files", filter.owner_id, filter.include_deleted,
                                        static_cast<int>(ingest::model::FileStatus::kDeleted), status, type_category, category,
                                        static_cast<int64_t>(page.limit), static_cast<int64_t>(page.offset));
  return ReadAll<model::FileRecord>(res, ReadFile);
}

// ------------------------------------------------------------------
// Variants
// ------------------------------------------------------------------

Result PgRepository::UpsertVariant(Transaction& t, const model::VariantRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_variant", r.id, r.file_id, static_cast<int>(r.kind), r.url, I64(r.width), I64(r.height),
                               I64(r.size_bytes), r.format, util::EncodeStringMap(r.metadata), I64(r.created_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::VariantRecord> PgRepository::ListVariants(Transaction& t, const std::string& file_id) {
  auto res = TX(t).Work().exec_prepared("list_variants", file_id);
  return ReadAll<model::VariantRecord>(res, ReadVariant);
}

Result PgRepository::DeleteVariants(Transaction& t, const std::string& file_id) {
  try {
    TX(t).Work().exec_prepared("delete_variants", file_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result PgRepository::UpsertJob(Transaction& t, const model::JobRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_job", r.id, r.queue, r.kind, util::HexEncode(r.payload), r.priority,
                               static_cast<int64_t>(r.attempts_made), static_cast<int64_t>(r.max_attempts), I64(r.backoff_initial_ms),
                               static_cast<int>(r.state), I64(r.available_at_ms), r.last_error, I64(r.created_at_ms),
                               I64(r.updated_at_ms), r.error_code);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_job", id);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

std::vector<model::JobRecord> PgRepository::ListJobs(Transaction& t, const std::string& queue) {
  auto res = TX(t).Work().exec_prepared("list_jobs", queue);
  return ReadAll<model::JobRecord>(res, ReadJob);
}

Result PgRepository::DeleteJob(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("delete_job", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace ingest::db::postgres
