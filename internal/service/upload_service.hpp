#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/core/upload_orchestrator.hpp"
#include "internal/upload/resumable_upload_manager.hpp"
#include "service_context.hpp"

namespace ingest::service {

// Attributes of the File created when a resumable session completes.
struct CompleteOptions {
  model::FileCategory             category = model::FileCategory::kContent;
  model::Privacy                  privacy  = model::Privacy::kPrivate;
  std::vector<model::VariantKind> variants;
  model::Metadata                 metadata;
};

class UploadService {
 public:
  explicit UploadService(ServiceContext ctx);

  db::model::SessionRecord InitUpload(const upload::InitUploadRequest& request);
  db::model::SessionRecord UploadChunk(const std::string& session_id, int64_t chunk_index, std::string_view bytes, const std::string& owner_id);
  db::model::SessionRecord GetSession(const std::string& session_id, const std::string& owner_id);
  std::vector<uint64_t>    GetMissingChunks(const std::string& session_id, const std::string& owner_id);

  // Hands the assembled content to the orchestrator, then releases the session.
  db::model::FileRecord CompleteUpload(const std::string& session_id, const std::string& owner_id, const CompleteOptions& options);

  void CancelUpload(const std::string& session_id, const std::string& owner_id);

  db::model::FileRecord Submit(const core::SubmitRequest& request);

  db::model::FileRecord GetFileStatus(const std::string& file_id, const std::string& owner_id);

 private:
  ServiceContext ctx_;
};

} // namespace ingest::service
