#include "resumable_upload_manager.hpp"

#include "internal/db/api/db_errors.hpp"
#include "internal/model/names.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace ingest::upload {

using db::model::SessionRecord;
using ingest::model::SessionStatus;
using observability::IntField;
using observability::StringField;

ResumableUploadManager::ResumableUploadManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<TempFileStore> files,
                                               ResumableOptions options)
    : repository_(std::move(repository)), files_(std::move(files)), options_(options) {
}

uint64_t ResumableUploadManager::ExpectedChunkSize(const SessionRecord& session, uint64_t chunk_index) {
  if (chunk_index + 1 < session.total_chunks) return session.chunk_size;
  const auto remainder = session.total_size % session.chunk_size;
  return remainder == 0 ? session.chunk_size : remainder;
}

SessionRecord ResumableUploadManager::Load(db::Transaction& tx, const std::string& session_id, const std::string& owner_id) {
  auto session = repository_->GetSession(tx, session_id);
  if (!session || session->owner_id != owner_id) {
    throw util::NotFound("upload session not found: " + session_id);
  }
  if (util::NowMillis() > session->expires_at_ms) {
    throw util::NotFound("upload session expired: " + session_id);
  }
  return *session;
}

SessionRecord ResumableUploadManager::InitUpload(const InitUploadRequest& request) {
  if (request.filename.empty()) throw util::InvalidArgument("filename is required");
  if (request.owner_id.empty()) throw util::InvalidArgument("owner is required");
  if (request.total_size <= 0) throw util::InvalidArgument("total size must be positive");
  if (request.chunk_size <= 0) throw util::InvalidArgument("chunk size must be positive");

  const auto total_size = static_cast<uint64_t>(request.total_size);
  const auto chunk_size = static_cast<uint64_t>(request.chunk_size);
  if (options_.max_total_size != 0 && total_size > options_.max_total_size) {
    throw util::Rejected("file size " + std::to_string(total_size) + " exceeds limit of " + std::to_string(options_.max_total_size));
  }

  const auto now = util::NowMillis();

  SessionRecord session;
  session.id            = util::NewId();
  session.owner_id      = request.owner_id;
  session.filename      = request.filename;
  session.mime_type     = request.mime_type;
  session.total_size    = total_size;
  session.chunk_size    = chunk_size;
  session.total_chunks  = (total_size + chunk_size - 1) / chunk_size;
  session.status        = SessionStatus::kActive;
  session.temp_path     = files_->NewPath(request.filename);
  session.metadata      = request.metadata;
  session.expires_at_ms = now + static_cast<uint64_t>(options_.session_ttl.count());
  session.created_at_ms = now;
  session.updated_at_ms = now;

  files_->Allocate(session.temp_path, total_size);

  try {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->InsertSession(*tx, session), "insert session " + session.id);
    tx->Commit();
  } catch (const std::exception&) {
    RemoveTempFile(session.temp_path);
    throw;
  }

  INGEST_LOG_INFO("upload session created", {StringField("session_id", session.id), StringField("owner_id", session.owner_id),
                                              IntField("total_chunks", static_cast<int64_t>(session.total_chunks))});
  return session;
}

/*
  Chunk write protocol (under the session mutex):

    1. validate against the current record
    2. positional write into the temp file, no transaction open
    3. record the index and size in one transaction

  Validation errors leave the session untouched; an I/O or persistence
  failure moves it to Failed.
*/
SessionRecord ResumableUploadManager::UploadChunk(const std::string& session_id, int64_t chunk_index, std::string_view bytes,
                                                  const std::string& owner_id) {
  auto guard = locks_.Lock(session_id);

  SessionRecord session;
  {
    auto tx = repository_->Begin();
    session = Load(*tx, session_id, owner_id);
  }

  if (chunk_index < 0 || static_cast<uint64_t>(chunk_index) >= session.total_chunks) {
    throw util::InvalidChunkIndex("chunk index " + std::to_string(chunk_index) + " outside [0, " + std::to_string(session.total_chunks) +
                                  ")");
  }
  const auto index = static_cast<uint64_t>(chunk_index);

  if (session.uploaded_chunks.contains(index) && session.status != SessionStatus::kFailed && session.status != SessionStatus::kExpired) {
    INGEST_LOG_DEBUG("duplicate chunk ignored", {StringField("session_id", session_id), IntField("chunk", chunk_index)});
    return session;
  }

  if (!ingest::model::IsWritable(session.status)) {
    throw util::SessionNotWritable("upload session " + session_id + " is " + std::string(ingest::model::ToString(session.status)));
  }

  const auto expected = ExpectedChunkSize(session, index);
  if (bytes.size() != expected) {
    throw util::ChunkSizeMismatch("chunk " + std::to_string(index) + " expected " + std::to_string(expected) + " bytes, got " +
                                  std::to_string(bytes.size()));
  }

  try {
    files_->WriteAt(session.temp_path, index * session.chunk_size, bytes);

    auto tx = repository_->Begin();
    session = Load(*tx, session_id, owner_id);
    if (session.uploaded_chunks.insert(index).second) {
      session.uploaded_size += bytes.size();
    }
    if (session.uploaded_chunks.size() == session.total_chunks) {
      session.status = SessionStatus::kCompleted;
    }
    session.updated_at_ms = util::NowMillis();
    db::ThrowIfDbError(repository_->UpdateSession(*tx, session), "update session " + session_id);
    tx->Commit();
  } catch (const util::NotFound&) {
    throw;
  } catch (const std::exception& e) {
    INGEST_LOG_ERROR("chunk write failed",
                     {StringField("session_id", session_id), IntField("chunk", chunk_index), StringField("error", e.what())});
    MarkFailed(session_id);
    throw;
  }

  if (session.status == SessionStatus::kCompleted) {
    INGEST_LOG_INFO("all chunks received", {StringField("session_id", session_id)});
  }
  return session;
}

void ResumableUploadManager::MarkFailed(const std::string& session_id) {
  try {
    auto tx      = repository_->Begin();
    auto session = repository_->GetSession(*tx, session_id);
    if (!session || ingest::model::IsTerminal(session->status)) return;
    session->status        = SessionStatus::kFailed;
    session->updated_at_ms = util::NowMillis();
    db::ThrowIfDbError(repository_->UpdateSession(*tx, *session), "fail session " + session_id);
    tx->Commit();
  } catch (const std::exception& e) {
    INGEST_LOG_ERROR("could not mark session failed", {StringField("session_id", session_id), StringField("error", e.what())});
  }
}

SessionRecord ResumableUploadManager::GetStatus(const std::string& session_id, const std::string& owner_id) {
  auto tx = repository_->Begin();
  return Load(*tx, session_id, owner_id);
}

std::vector<uint64_t> ResumableUploadManager::GetMissingChunks(const std::string& session_id, const std::string& owner_id) {
  auto session = GetStatus(session_id, owner_id);

  std::vector<uint64_t> missing;
  missing.reserve(session.RemainingChunks());
  for (uint64_t i = 0; i < session.total_chunks; ++i) {
    if (!session.uploaded_chunks.contains(i)) missing.push_back(i);
  }
  return missing;
}

CompletedUpload ResumableUploadManager::CompleteUpload(const std::string& session_id, const std::string& owner_id) {
  auto guard = locks_.Lock(session_id);

  SessionRecord session;
  {
    auto tx = repository_->Begin();
    session = Load(*tx, session_id, owner_id);
  }
  if (session.status != SessionStatus::kCompleted) {
    throw util::NotCompleted("upload session " + session_id + " has " + std::to_string(session.RemainingChunks()) + " chunks missing");
  }

  auto data = files_->ReadAll(session.temp_path);
  if (static_cast<uint64_t>(data->size()) != session.total_size) {
    throw util::SizeMismatch("expected " + std::to_string(session.total_size) + " bytes, read " + std::to_string(data->size()));
  }

  INGEST_LOG_INFO("upload assembled", {StringField("session_id", session_id), IntField("bytes", data->size())});
  return {std::move(data), std::move(session)};
}

void ResumableUploadManager::CancelUpload(const std::string& session_id, const std::string& owner_id) {
  auto guard = locks_.Lock(session_id);

  std::string temp_path;
  {
    auto tx      = repository_->Begin();
    auto session = Load(*tx, session_id, owner_id);
    temp_path    = session.temp_path;
    if (!ingest::model::CanTransition(session.status, SessionStatus::kFailed)) {
      throw util::SessionNotWritable("upload session " + session_id + " is " + std::string(ingest::model::ToString(session.status)) +
                                     " and cannot be cancelled");
    }
    if (session.status != SessionStatus::kFailed) {
      session.status        = SessionStatus::kFailed;
      session.updated_at_ms = util::NowMillis();
      db::ThrowIfDbError(repository_->UpdateSession(*tx, session), "cancel session " + session_id);
      tx->Commit();
    }
  }

  files_->Remove(temp_path);
  INGEST_LOG_INFO("upload session cancelled", {StringField("session_id", session_id)});
}

void ResumableUploadManager::RemoveTempFile(const std::string& path) {
  try {
    files_->Remove(path);
  } catch (const std::exception& e) {
    INGEST_LOG_WARN("temp file cleanup failed", {StringField("path", path), StringField("error", e.what())});
  }
}

SweepStats ResumableUploadManager::SweepExpired(util::TimePoint now) {
  const auto now_ms = util::ToUnixMillis(now);
  SweepStats stats;

  std::vector<SessionRecord> expired;
  {
    auto tx = repository_->Begin();
    expired = repository_->ListExpiredSessions(*tx, now_ms);
  }

  for (const auto& candidate : expired) {
    auto guard = locks_.Lock(candidate.id);

    auto tx      = repository_->Begin();
    auto session = repository_->GetSession(*tx, candidate.id);
    if (!session || session->status != SessionStatus::kActive || session->expires_at_ms >= now_ms) continue;

    session->status        = SessionStatus::kExpired;
    session->updated_at_ms = now_ms;
    db::ThrowIfDbError(repository_->UpdateSession(*tx, *session), "expire session " + session->id);
    tx->Commit();
    tx.reset();

    RemoveTempFile(session->temp_path);
    ++stats.expired;
  }

  const auto ttl_ms = static_cast<uint64_t>(options_.session_ttl.count());
  if (now_ms > ttl_ms) {
    std::vector<SessionRecord> stale;
    {
      auto tx = repository_->Begin();
      stale   = repository_->ListStaleSessions(*tx, now_ms - ttl_ms);
    }
    for (const auto& session : stale) {
      Release(session.id);
      ++stats.purged;
    }
  }

  if (stats.expired != 0 || stats.purged != 0) {
    INGEST_LOG_INFO("session sweep", {IntField("expired", stats.expired), IntField("purged", stats.purged)});
  }
  return stats;
}

void ResumableUploadManager::Release(const std::string& session_id) {
  {
    auto guard = locks_.Lock(session_id);

    auto tx      = repository_->Begin();
    auto session = repository_->GetSession(*tx, session_id);
    if (session) {
      db::ThrowIfDbError(repository_->DeleteSession(*tx, session_id), "delete session " + session_id);
      tx->Commit();
      tx.reset();
      RemoveTempFile(session->temp_path);
    }
  }
}

} // namespace ingest::upload
