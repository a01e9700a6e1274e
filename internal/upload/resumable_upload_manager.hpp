#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/upload/session_locks.hpp"
#include "internal/upload/temp_file_store.hpp"
#include "internal/util/time.hpp"

namespace ingest::upload {

struct ResumableOptions {
  std::chrono::milliseconds session_ttl{std::chrono::hours(24)};
  uint64_t                  max_total_size = 0; // 0 = unlimited
};

struct InitUploadRequest {
  std::string     filename;
  int64_t         total_size = 0;
  std::string     mime_type;
  int64_t         chunk_size = 0;
  std::string     owner_id;
  model::Metadata metadata;
};

struct CompletedUpload {
  std::shared_ptr<arrow::Buffer> data;
  db::model::SessionRecord       session;
};

struct SweepStats {
  uint32_t expired = 0;
  uint32_t purged  = 0;
};

/*
  ResumableUploadManager

  Owns upload sessions and their pre-sized temp files.

  Concurrency:
    - every operation on a session takes that session's mutex
    - repository transactions are short and never span file I/O

  Visibility:
    - a session owned by someone else, or past its expiry, is NotFound
*/
class ResumableUploadManager {
 public:
  ResumableUploadManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<TempFileStore> files, ResumableOptions options);

  db::model::SessionRecord InitUpload(const InitUploadRequest& request);

  db::model::SessionRecord UploadChunk(const std::string& session_id, int64_t chunk_index, std::string_view bytes, const std::string& owner_id);

  db::model::SessionRecord GetStatus(const std::string& session_id, const std::string& owner_id);

  std::vector<uint64_t> GetMissingChunks(const std::string& session_id, const std::string& owner_id);

  CompletedUpload CompleteUpload(const std::string& session_id, const std::string& owner_id);

  // Idempotent for Failed sessions. A Completed session is past cancelling: SessionNotWritable.
  void CancelUpload(const std::string& session_id, const std::string& owner_id);

  // Expires overdue Active sessions and purges terminal rows older than one TTL.
  SweepStats SweepExpired(util::TimePoint now);

  // Destroys record and temp file once the content was handed off.
  void Release(const std::string& session_id);

  // Expected byte length of one chunk.
  static uint64_t ExpectedChunkSize(const db::model::SessionRecord& session, uint64_t chunk_index);

 private:
  db::model::SessionRecord Load(db::Transaction& tx, const std::string& session_id, const std::string& owner_id);
  void                     MarkFailed(const std::string& session_id);
  void                     RemoveTempFile(const std::string& path);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<TempFileStore>  files_;
  ResumableOptions                options_;
  SessionLocks                    locks_;
};

} // namespace ingest::upload
