#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace {

using ingest::model::FileStatus;
using ingest::model::ProviderKind;

std::string FilePath(const std::string& url) {
  assert(url.rfind("file://", 0) == 0);
  return url.substr(7);
}

template <typename ErrorT, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const ErrorT&) {
    return true;
  }
  return false;
}

/*
  Drives the composed application end to end with the in-memory
  repository and a local object store: resumable upload, direct submit,
  listing, download URLs, variants, soft delete and admin operations.
*/
void RunPipeline(const std::filesystem::path& root) {
  const auto yaml = "database:\n"
                    "  memory: {}\n"
                    "resumable:\n"
                    "  temp_directory: " + (root / "tmp").string() + "\n"
                    "queue:\n"
                    "  backoff_initial_ms: 5\n"
                    "providers:\n"
                    "  object_store:\n"
                    "    root_uri: " + (root / "objects").string() + "\n";
  auto config = ingest::config::ConfigLoader::LoadFromString(yaml);
  auto app    = ingest::factory::Build(config);

  assert(app.router->HasMedia() == false);
  assert(app.background_workers.size() == 3);

  // Resumable upload in three chunks, delivered out of order.
  const std::string pdf = "%PDF-1.7\nhello resumable world";
  ingest::upload::InitUploadRequest init;
  init.filename   = "Quarterly Report.pdf";
  init.total_size = static_cast<int64_t>(pdf.size());
  init.chunk_size = 12;
  init.mime_type  = "application/pdf";
  init.owner_id   = "alice";

  auto session = app.upload_service->InitUpload(init);
  assert(session.total_chunks == 3);
  app.upload_service->UploadChunk(session.id, 2, std::string_view(pdf).substr(24), "alice");
  app.upload_service->UploadChunk(session.id, 0, std::string_view(pdf).substr(0, 12), "alice");
  assert((app.upload_service->GetMissingChunks(session.id, "alice") == std::vector<uint64_t>{1}));
  app.upload_service->UploadChunk(session.id, 1, std::string_view(pdf).substr(12, 12), "alice");

  ingest::service::CompleteOptions complete;
  complete.category = ingest::model::FileCategory::kDocument;
  auto report       = app.upload_service->CompleteUpload(session.id, "alice", complete);
  assert(report.status == FileStatus::kUploading);
  assert(report.metadata.at("upload_session_id") == session.id);
  assert(Throws<ingest::util::NotFound>([&] { app.upload_service->GetSession(session.id, "alice"); }));

  app.DrainQueues();

  report = app.upload_service->GetFileStatus(report.id, "alice");
  assert(report.status == FileStatus::kReady);
  assert(report.primary_provider == ProviderKind::kObjectStore);
  assert(report.primary_object_id == "files/" + report.generated_filename);

  const auto report_path = FilePath(app.file_service->DownloadUrl(report.id, "alice"));
  assert(std::filesystem::exists(report_path));
  assert(std::filesystem::file_size(report_path) == pdf.size());

  // Direct submit of a public image; without a media provider it lands in the object store too.
  ingest::core::SubmitRequest image;
  image.data          = ingest::storage::common::ToBuffer(std::string("\x89PNG\r\n\x1a\n", 8) + "pixels");
  image.original_name = "cat.png";
  image.mime_type     = "image/png";
  image.owner_id      = "alice";
  image.privacy       = ingest::model::Privacy::kPublic;
  auto cat            = app.upload_service->Submit(image);
  app.DrainQueues();

  ingest::db::FileFilter filter;
  filter.owner_id = "alice";
  auto listed     = app.file_service->ListFiles(filter, {});
  assert(listed.size() == 2);

  filter.type_category = ingest::model::TypeCategory::kImage;
  listed               = app.file_service->ListFiles(filter, {});
  assert(listed.size() == 1 && listed[0].id == cat.id);

  // The object store hands back originals, so no variant rows appear.
  app.file_service->RequestVariants(cat.id, "alice", {ingest::model::VariantKind::kThumbnail});
  app.DrainQueues();
  assert(app.file_service->ListVariants(cat.id, "alice").empty());
  assert(Throws<ingest::util::UnsupportedType>(
      [&] { app.file_service->RequestVariants(report.id, "alice", {ingest::model::VariantKind::kThumbnail}); }));

  // Ownership.
  assert(Throws<ingest::util::NotFound>([&] { app.file_service->GetFile(cat.id, "bob"); }));
  assert(Throws<ingest::util::InvalidArgument>([&] { app.file_service->ListFiles({}, {}); }));

  // Soft delete removes the remote object asynchronously.
  app.file_service->DeleteFile(report.id, "alice");
  assert(Throws<ingest::util::NotFound>([&] { app.file_service->GetFile(report.id, "alice"); }));
  app.DrainQueues();
  assert(!std::filesystem::exists(report_path));
  assert(app.upload_service->GetFileStatus(report.id, "alice").status == FileStatus::kDeleted);

  // Admin surface.
  auto stats = app.admin_service->Stats();
  assert(stats.size() == 2);
  assert(stats[0].queue == "accept");
  assert(stats[0].counts.completed == 2);
  assert(stats[1].counts.failed == 0);

  auto health = app.admin_service->Health();
  assert(health.Healthy());
  assert(!health.media_configured);

  assert(app.admin_service->FailedJobs("processing").empty());
  assert(Throws<ingest::util::InvalidArgument>([&] { app.admin_service->FailedJobs("bogus"); }));
  assert(Throws<ingest::util::NotFound>([&] { app.admin_service->RetryJob("accept", "missing"); }));

  auto swept = app.admin_service->SweepSessions();
  assert(swept.expired == 0);

  app.Stop();
}

} // namespace

int main() {
  const auto root = std::filesystem::temp_directory_path() / ("ingest-pipeline-" + std::to_string(::getpid()));
  std::filesystem::remove_all(root);

  RunPipeline(root);

  std::filesystem::remove_all(root);
  std::cout << "ingest_manager_integration_pipeline: pass\n";
  return 0;
}
