#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/provider_router.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/fake_storage.hpp"

namespace {

using ingest::model::ProviderKind;
using ingest::model::TypeCategory;
using ingest::storage::BackupOptions;
using ingest::storage::ChooseProviderKind;
using ingest::storage::ProviderRouter;
using ingest::testing::MakeFakeMedia;
using ingest::testing::MakeFakeObjectStore;

static_assert(ChooseProviderKind(TypeCategory::kImage) == ProviderKind::kTransform);
static_assert(ChooseProviderKind(TypeCategory::kVideo) == ProviderKind::kTransform);
static_assert(ChooseProviderKind(TypeCategory::kDocument) == ProviderKind::kObjectStore);
static_assert(ChooseProviderKind(TypeCategory::kAudio) == ProviderKind::kObjectStore);
static_assert(ChooseProviderKind(TypeCategory::kOther) == ProviderKind::kObjectStore);

ingest::db::model::FileRecord MediaFile() {
  ingest::db::model::FileRecord file;
  file.id                 = "file-1";
  file.generated_filename = "photo_1_abc.png";
  file.mime_type          = "image/png";
  file.type_category      = TypeCategory::kImage;
  file.primary_provider   = ProviderKind::kTransform;
  return file;
}

void TestRoutingWithMedia() {
  auto media  = MakeFakeMedia();
  auto store  = MakeFakeObjectStore();
  auto router = ProviderRouter(media, store, BackupOptions{});

  assert(router.HasMedia());
  assert(router.Choose(TypeCategory::kImage) == media);
  assert(router.Choose(TypeCategory::kVideo) == media);
  assert(router.Choose(TypeCategory::kDocument) == store);
  assert(router.Choose(TypeCategory::kArchive) == store);
  assert(router.ForKind(ProviderKind::kTransform) == media);
  assert(router.ForKind(ProviderKind::kObjectStore) == store);

  bool threw = false;
  try {
    (void)router.ForKind(ProviderKind::kNone);
  } catch (const ingest::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestFallbackWithoutMedia() {
  auto store  = MakeFakeObjectStore();
  auto router = ProviderRouter(nullptr, store, BackupOptions{});

  assert(!router.HasMedia());
  assert(router.Choose(TypeCategory::kImage) == store);
  assert(router.Choose(TypeCategory::kVideo) == store);

  bool threw = false;
  try {
    (void)router.ForKind(ProviderKind::kTransform);
  } catch (const ingest::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestObjectStoreRequired() {
  bool threw = false;
  try {
    ProviderRouter router(MakeFakeMedia(), nullptr, BackupOptions{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestReplicateWritesPrivateBackup() {
  auto store = MakeFakeObjectStore();

  BackupOptions backup;
  backup.enabled = true;
  backup.folder  = "backups/2024";
  ProviderRouter router(MakeFakeMedia(), store, backup);
  assert(router.BackupEnabled());

  auto result = router.Replicate(MediaFile(), ingest::storage::common::ToBuffer("png-bytes"));
  assert(result.has_value());
  assert(result->object_id == "store/backups/2024/backup_photo_1_abc.png");
  assert(!store->last_upload.is_public);
  assert(store->last_upload.metadata.at("is_backup") == "true");
  assert(store->last_upload.metadata.at("original_file_id") == "file-1");
  assert(store->objects.at(result->object_id) == "png-bytes");
}

void TestReplicateSkipsAndSwallowsFailures() {
  auto           store = MakeFakeObjectStore();
  ProviderRouter router(MakeFakeMedia(), store, BackupOptions{true, "backups"});

  auto stored             = MediaFile();
  stored.primary_provider = ProviderKind::kObjectStore;
  assert(!router.Replicate(stored, ingest::storage::common::ToBuffer("x")).has_value());
  assert(store->upload_calls == 0);

  store->fail_uploads = 1;
  assert(!router.Replicate(MediaFile(), ingest::storage::common::ToBuffer("x")).has_value());
  assert(store->upload_calls == 1);
}

void TestCheckUploadable() {
  auto media = MakeFakeMedia();
  bool unsupported = false;
  try {
    media->CheckUploadable(TypeCategory::kDocument, 10);
  } catch (const ingest::util::UnsupportedType&) {
    unsupported = true;
  }
  assert(unsupported);

  auto small = std::make_shared<ingest::testing::FakeProvider>(ProviderKind::kObjectStore, std::vector<TypeCategory>{TypeCategory::kOther}, 4);
  small->CheckUploadable(TypeCategory::kOther, 4);
  bool too_large = false;
  try {
    small->CheckUploadable(TypeCategory::kOther, 5);
  } catch (const ingest::util::TooLarge&) {
    too_large = true;
  }
  assert(too_large);
}

} // namespace

int main() {
  TestRoutingWithMedia();
  TestFallbackWithoutMedia();
  TestObjectStoreRequired();
  TestReplicateWritesPrivateBackup();
  TestReplicateSkipsAndSwallowsFailures();
  TestCheckUploadable();

  std::cout << "ingest_manager_unit_provider_router: pass\n";
  return 0;
}
