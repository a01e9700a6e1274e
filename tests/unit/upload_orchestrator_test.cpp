#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/core/upload_orchestrator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/fake_storage.hpp"

namespace {

using ingest::core::OrchestratorOptions;
using ingest::core::SubmitRequest;
using ingest::core::UploadOrchestrator;
using ingest::db::model::FileRecord;
using ingest::model::FileStatus;
using ingest::model::ProviderKind;
using ingest::model::VariantKind;
using ingest::queue::JobQueue;
using ingest::queue::JobWorkerPool;
using ingest::queue::QueueDefaults;
using ingest::storage::common::ToBuffer;
using ingest::testing::FakeProvider;
using ingest::testing::FakeScanner;

const std::string kPng = std::string("\x89PNG\r\n\x1a\n", 8) + "pixels";

struct Pipeline {
  explicit Pipeline(bool backup = true, bool with_scanner = false, OrchestratorOptions options = {}) {
    repository = std::make_shared<ingest::db::memory::MemoryRepository>();
    media      = ingest::testing::MakeFakeMedia();
    store      = ingest::testing::MakeFakeObjectStore();
    router     = std::make_shared<ingest::storage::ProviderRouter>(media, store, ingest::storage::BackupOptions{backup, "backups"});

    QueueDefaults defaults;
    defaults.max_attempts       = 3;
    defaults.backoff_initial_ms = 5;
    accept_queue                = std::make_shared<JobQueue>(ingest::queue::kAcceptQueue, repository, defaults);
    processing_queue            = std::make_shared<JobQueue>(ingest::queue::kProcessingQueue, repository, defaults);

    if (with_scanner) scanner = std::make_shared<FakeScanner>();
    orchestrator = std::make_unique<UploadOrchestrator>(repository, router, accept_queue, processing_queue, scanner, options);

    accept     = std::make_unique<JobWorkerPool>(accept_queue, 1);
    processing = std::make_unique<JobWorkerPool>(processing_queue, 1);
    orchestrator->RegisterHandlers(*accept, *processing);
  }

  void Drain() {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
      const bool ran_accept     = accept->RunOnce();
      const bool ran_processing = processing->RunOnce();
      if (ran_accept || ran_processing) continue;
      if (accept_queue->Idle() && processing_queue->Idle()) return;
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    assert(false && "pipeline did not drain");
  }

  FileRecord Load(const std::string& id) {
    auto tx   = repository->Begin();
    auto file = repository->GetFile(*tx, id);
    assert(file.has_value());
    return *file;
  }

  std::vector<ingest::db::model::VariantRecord> Variants(const std::string& id) {
    auto tx = repository->Begin();
    return repository->ListVariants(*tx, id);
  }

  void MarkDeleted(const std::string& id) {
    auto file          = Load(id);
    file.status        = FileStatus::kDeleted;
    file.deleted_at_ms = 1;
    auto tx            = repository->Begin();
    auto result        = repository->UpdateFile(*tx, file);
    assert(result);
    tx->Commit();
  }

  std::shared_ptr<ingest::db::memory::MemoryRepository> repository;
  std::shared_ptr<FakeProvider>                         media;
  std::shared_ptr<FakeProvider>                         store;
  std::shared_ptr<ingest::storage::ProviderRouter>      router;
  std::shared_ptr<JobQueue>                             accept_queue;
  std::shared_ptr<JobQueue>                             processing_queue;
  std::shared_ptr<FakeScanner>                          scanner;
  std::unique_ptr<UploadOrchestrator>                   orchestrator;
  std::unique_ptr<JobWorkerPool>                        accept;
  std::unique_ptr<JobWorkerPool>                        processing;
};

SubmitRequest Image(const std::string& owner = "alice", const std::string& content = kPng) {
  SubmitRequest request;
  request.data          = ToBuffer(content);
  request.original_name = "Holiday Photo.PNG";
  request.mime_type     = "image/png";
  request.owner_id      = owner;
  request.privacy       = ingest::model::Privacy::kPublic;
  request.variants      = {VariantKind::kThumbnail, VariantKind::kWebp};
  request.metadata      = {{"album", "summer"}};
  return request;
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

void TestImageFlowsThroughPipeline() {
  Pipeline p;
  auto     accepted = p.orchestrator->SubmitUpload(Image());

  assert(accepted.status == FileStatus::kUploading);
  assert(accepted.type_category == ingest::model::TypeCategory::kImage);
  assert(accepted.generated_filename.find("Holiday_Photo_") == 0);
  assert(accepted.generated_filename.size() > 4 && accepted.generated_filename.substr(accepted.generated_filename.size() - 4) == ".png");
  assert(accepted.content_hash.size() == 64);
  assert(accepted.metadata.at("album") == "summer");
  assert(accepted.metadata.at("virus_scanned") == "false");
  assert(accepted.metadata.count("uploaded_at") == 1);
  assert(p.accept_queue->Counts().waiting == 1);

  p.Drain();

  auto file = p.Load(accepted.id);
  assert(file.status == FileStatus::kReady);
  assert(file.primary_provider == ProviderKind::kTransform);
  assert(file.primary_object_id == "media/uploads/" + file.generated_filename);
  assert(file.primary_url == "https://fake.test/" + file.primary_object_id);
  assert(file.metadata.at("stored_by") == "media/");
  assert(file.metadata.count("processed_at") == 1);
  assert(p.media->last_upload.is_public);
  assert(p.media->last_upload.metadata.at("file_id") == file.id);

  assert(file.backup_provider == ProviderKind::kObjectStore);
  assert(file.backup_object_id == "store/backups/backup_" + file.generated_filename);
  assert(p.store->objects.at(file.backup_object_id) == kPng);

  auto variants = p.Variants(file.id);
  assert(variants.size() == 2);
  assert(variants[0].kind == VariantKind::kThumbnail);
  assert(variants[0].width == 150u);
  assert(variants[0].metadata.at("processed_by") == "fake");
  assert(variants[1].kind == VariantKind::kWebp);
  assert(variants[1].format == "webp");

  // Regenerating replaces rows instead of duplicating them.
  p.orchestrator->EnqueueVariants(file.id, {VariantKind::kThumbnail});
  p.Drain();
  assert(p.Variants(file.id).size() == 2);
}

void TestDeduplicationIsPerOwner() {
  Pipeline p;
  auto     first  = p.orchestrator->SubmitUpload(Image("alice"));
  auto     second = p.orchestrator->SubmitUpload(Image("alice"));
  assert(second.id == first.id);
  assert(p.accept_queue->Counts().waiting == 1);

  auto other = p.orchestrator->SubmitUpload(Image("bob"));
  assert(other.id != first.id);

  p.Drain();
  auto after = p.orchestrator->SubmitUpload(Image("alice"));
  assert(after.id == first.id);
  assert(after.status == FileStatus::kReady);
  assert(p.media->upload_calls == 2);
}

void TestDocumentsGoToObjectStore() {
  Pipeline p;

  SubmitRequest request;
  request.data          = ToBuffer("%PDF-1.7 body");
  request.original_name = "contract.pdf";
  request.mime_type     = "application/pdf";
  request.owner_id      = "alice";
  request.variants      = {VariantKind::kThumbnail};

  auto accepted = p.orchestrator->SubmitUpload(request);
  assert(accepted.privacy == ingest::model::Privacy::kPrivate);
  p.Drain();

  auto file = p.Load(accepted.id);
  assert(file.status == FileStatus::kReady);
  assert(file.primary_provider == ProviderKind::kObjectStore);
  assert(!p.store->last_upload.is_public);
  assert(file.backup_object_id.empty());
  assert(p.Variants(file.id).empty());
  assert(p.media->upload_calls == 0);
}

void TestValidationRejects() {
  Pipeline p;

  auto zip      = Image();
  zip.mime_type = "application/zip";
  assert(Throws<ingest::util::Rejected>([&] { p.orchestrator->SubmitUpload(zip); }));

  auto svg          = Image("alice", "<svg><script>alert(1)</script></svg>");
  svg.mime_type     = "image/svg+xml";
  svg.original_name = "logo.svg";
  assert(Throws<ingest::util::SuspiciousContent>([&] { p.orchestrator->SubmitUpload(svg); }));

  auto empty_owner = Image("");
  assert(Throws<ingest::util::InvalidArgument>([&] { p.orchestrator->SubmitUpload(empty_owner); }));

  ingest::db::FileFilter filter;
  filter.owner_id = "alice";
  auto tx         = p.repository->Begin();
  assert(p.repository->ListFiles(*tx, filter, {}).empty());
  tx.reset();
  assert(p.accept_queue->Idle());
}

void TestStrictContentType() {
  OrchestratorOptions options;
  options.policy.strict_content_type = true;
  Pipeline strict(true, false, options);

  auto disguised      = Image("alice", "%PDF-1.4 not an image");
  assert(Throws<ingest::util::Rejected>([&] { strict.orchestrator->SubmitUpload(disguised); }));

  // A Windows executable declared as a PNG.
  const auto executable = std::string("MZ\x90\x00\x03\x00\x00\x00", 8) + "This program cannot be run in DOS mode.";
  std::string reason;
  try {
    strict.orchestrator->SubmitUpload(Image("alice", executable));
  } catch (const ingest::util::Rejected& e) {
    reason = e.what();
  }
  assert(reason.find("application/x-msdownload") != std::string::npos);

  Pipeline lenient;
  auto     accepted = lenient.orchestrator->SubmitUpload(Image("alice", "%PDF-1.4 not an image"));
  assert(accepted.status == FileStatus::kUploading);
  auto mislabelled = lenient.orchestrator->SubmitUpload(Image("bob", executable));
  assert(mislabelled.status == FileStatus::kUploading);
  assert(mislabelled.mime_type == "image/png");
}

void TestVirusScanning() {
  Pipeline p(false, true);
  assert(Throws<ingest::util::Rejected>([&] { p.orchestrator->SubmitUpload(Image("alice", kPng + "EICAR")); }));

  auto clean = p.orchestrator->SubmitUpload(Image());
  assert(clean.metadata.at("virus_scanned") == "true");
  assert(clean.metadata.count("virus_scan_date") == 1);

  p.scanner->unavailable = true;
  auto unscanned         = p.orchestrator->SubmitUpload(Image("bob"));
  assert(unscanned.metadata.at("virus_scanned") == "false");

  OrchestratorOptions strict;
  strict.virus_scan_strict = true;
  Pipeline guarded(false, true, strict);
  guarded.scanner->unavailable = true;
  assert(Throws<ingest::util::Rejected>([&] { guarded.orchestrator->SubmitUpload(Image()); }));
}

void TestProviderFailureIsRetried() {
  Pipeline p(false);
  p.media->fail_uploads = 1;

  auto accepted = p.orchestrator->SubmitUpload(Image());
  assert(p.accept->RunOnce());

  auto failed = p.Load(accepted.id);
  assert(failed.status == FileStatus::kFailed);
  assert(failed.metadata.at("error") == "injected upload failure");
  assert(p.accept_queue->Counts().delayed == 1);

  p.Drain();
  auto file = p.Load(accepted.id);
  assert(file.status == FileStatus::kReady);
  assert(file.metadata.count("error") == 0);
  assert(p.media->upload_calls == 2);
  assert(p.accept_queue->Counts().failed == 0);
}

void TestExhaustedUploadStaysFailed() {
  Pipeline p(false);
  p.media->fail_uploads = 3;

  auto accepted = p.orchestrator->SubmitUpload(Image());
  p.Drain();

  assert(p.Load(accepted.id).status == FileStatus::kFailed);
  auto failed = p.accept_queue->FailedJobs();
  assert(failed.size() == 1);
  assert(failed[0].attempts_made == 3);
  assert(failed[0].last_error.rfind("exhausted after 3 attempts", 0) == 0);
  assert(failed[0].error_code == "JobExhausted");
  {
    auto tx        = p.repository->Begin();
    auto persisted = p.repository->GetJob(*tx, failed[0].id);
    assert(persisted && persisted->error_code == "JobExhausted");
  }

  // A failed file never satisfies dedup.
  auto retry = p.orchestrator->SubmitUpload(Image());
  assert(retry.id != accepted.id);
}

void TestCleanupRemovesRemoteCopies() {
  Pipeline p;
  auto     accepted = p.orchestrator->SubmitUpload(Image());
  p.Drain();
  auto file = p.Load(accepted.id);

  // Live files are never cleaned up.
  p.orchestrator->EnqueueCleanup(file.id);
  p.Drain();
  assert(p.processing_queue->Counts().failed == 1);
  assert(p.media->objects.count(file.primary_object_id) == 1);

  p.MarkDeleted(file.id);
  p.orchestrator->EnqueueCleanup(file.id);
  p.Drain();
  assert(p.media->objects.count(file.primary_object_id) == 0);
  assert(p.store->objects.count(file.backup_object_id) == 0);

  // Transient provider errors are retried.
  auto second = p.orchestrator->SubmitUpload(Image("carol"));
  p.Drain();
  p.MarkDeleted(second.id);
  p.media->fail_deletes = 1;
  p.orchestrator->EnqueueCleanup(second.id);
  p.Drain();
  assert(p.processing_queue->Counts().failed == 1);
  assert(p.media->objects.count(p.Load(second.id).primary_object_id) == 0);
}

void TestDeletedBeforeUploadDropsJob() {
  Pipeline p;
  auto     accepted = p.orchestrator->SubmitUpload(Image());
  p.MarkDeleted(accepted.id);
  p.Drain();

  assert(p.media->upload_calls == 0);
  assert(p.Load(accepted.id).status == FileStatus::kDeleted);
  assert(p.accept_queue->Counts().completed == 1);
}

void TestDeleteDuringClaimIsKept() {
  Pipeline p;
  auto     accepted = p.orchestrator->SubmitUpload(Image());
  bool     deleted  = false;
  p.media->on_size_check = [&] {
    if (deleted) return;
    deleted = true;
    p.MarkDeleted(accepted.id);
  };
  p.Drain();

  assert(p.media->upload_calls == 0);
  assert(p.media->objects.empty());
  auto file = p.Load(accepted.id);
  assert(file.status == FileStatus::kDeleted);
  assert(file.primary_object_id.empty());
  assert(p.accept_queue->Counts().completed == 1);
}

} // namespace

int main() {
  TestImageFlowsThroughPipeline();
  TestDeduplicationIsPerOwner();
  TestDocumentsGoToObjectStore();
  TestValidationRejects();
  TestStrictContentType();
  TestVirusScanning();
  TestProviderFailureIsRetried();
  TestExhaustedUploadStaysFailed();
  TestCleanupRemovesRemoteCopies();
  TestDeletedBeforeUploadDropsJob();
  TestDeleteDuringClaimIsKept();

  std::cout << "ingest_manager_unit_upload_orchestrator: pass\n";
  return 0;
}
