#include "upload_service.hpp"

#include "internal/db/api/repository.hpp"
#include "observe_call.hpp"

namespace ingest::service {

UploadService::UploadService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

db::model::SessionRecord UploadService::InitUpload(const upload::InitUploadRequest& request) {
  return ObserveCall("UploadService.InitUpload", [&] { return ctx_.uploads->InitUpload(request); });
}

db::model::SessionRecord UploadService::UploadChunk(const std::string& session_id, int64_t chunk_index, std::string_view bytes,
                                                    const std::string& owner_id) {
  return ObserveCall("UploadService.UploadChunk", [&] { return ctx_.uploads->UploadChunk(session_id, chunk_index, bytes, owner_id); });
}

db::model::SessionRecord UploadService::GetSession(const std::string& session_id, const std::string& owner_id) {
  return ObserveCall("UploadService.GetSession", [&] { return ctx_.uploads->GetStatus(session_id, owner_id); });
}

std::vector<uint64_t> UploadService::GetMissingChunks(const std::string& session_id, const std::string& owner_id) {
  return ObserveCall("UploadService.GetMissingChunks", [&] { return ctx_.uploads->GetMissingChunks(session_id, owner_id); });
}

db::model::FileRecord UploadService::CompleteUpload(const std::string& session_id, const std::string& owner_id, const CompleteOptions& options) {
  return ObserveCall("UploadService.CompleteUpload", [&] {
    auto completed = ctx_.uploads->CompleteUpload(session_id, owner_id);

    core::SubmitRequest request;
    request.data          = completed.data;
    request.original_name = completed.session.filename;
    request.mime_type     = completed.session.mime_type;
    request.owner_id      = owner_id;
    request.category      = options.category;
    request.privacy       = options.privacy;
    request.variants      = options.variants;
    request.metadata      = completed.session.metadata;
    model::Merge(request.metadata, options.metadata);
    request.metadata["upload_session_id"] = session_id;

    auto file = ctx_.orchestrator->SubmitUpload(request);
    ctx_.uploads->Release(session_id);
    return file;
  });
}

void UploadService::CancelUpload(const std::string& session_id, const std::string& owner_id) {
  ObserveCall("UploadService.CancelUpload", [&] { ctx_.uploads->CancelUpload(session_id, owner_id); });
}

db::model::FileRecord UploadService::Submit(const core::SubmitRequest& request) {
  return ObserveCall("UploadService.Submit", [&] { return ctx_.orchestrator->SubmitUpload(request); });
}

db::model::FileRecord UploadService::GetFileStatus(const std::string& file_id, const std::string& owner_id) {
  return ObserveCall("UploadService.GetFileStatus", [&] {
    auto tx   = ctx_.repository->Begin();
    auto file = ctx_.repository->GetFile(*tx, file_id);
    if (!file || file->owner_id != owner_id) throw util::NotFound("file not found: " + file_id);
    return *file;
  });
}

} // namespace ingest::service
