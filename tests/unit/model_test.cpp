#include <cassert>
#include <iostream>

#include "internal/model/file.hpp"
#include "internal/model/names.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/variant.hpp"

namespace {

using namespace ingest::model;

void TestCategoryFromMime() {
  assert(CategoryFromMime("image/png") == TypeCategory::kImage);
  assert(CategoryFromMime("video/quicktime") == TypeCategory::kVideo);
  assert(CategoryFromMime("audio/mpeg") == TypeCategory::kAudio);
  assert(CategoryFromMime("application/pdf") == TypeCategory::kDocument);
  assert(CategoryFromMime("application/vnd.openxmlformats-officedocument.wordprocessingml.document") == TypeCategory::kDocument);
  assert(CategoryFromMime("text/plain") == TypeCategory::kDocument);
  assert(CategoryFromMime("application/zip") == TypeCategory::kArchive);
  assert(CategoryFromMime("application/x-tar") == TypeCategory::kArchive);
  assert(CategoryFromMime("application/octet-stream") == TypeCategory::kOther);
}

void TestPriorities() {
  static_assert(UploadPriority(TypeCategory::kImage) < UploadPriority(TypeCategory::kVideo));
  static_assert(UploadPriority(TypeCategory::kVideo) < UploadPriority(TypeCategory::kDocument));
  static_assert(UploadPriority(TypeCategory::kDocument) < UploadPriority(TypeCategory::kArchive));
  static_assert(IsPubliclyReadable(Privacy::kPublic));
  static_assert(!IsPubliclyReadable(Privacy::kProtected));
}

void TestFileTransitions() {
  static_assert(CanTransition(FileStatus::kUploading, FileStatus::kProcessing));
  static_assert(CanTransition(FileStatus::kProcessing, FileStatus::kReady));
  static_assert(CanTransition(FileStatus::kUploading, FileStatus::kFailed));
  static_assert(CanTransition(FileStatus::kFailed, FileStatus::kReady));
  static_assert(CanTransition(FileStatus::kReady, FileStatus::kDeleted));
  static_assert(!CanTransition(FileStatus::kDeleted, FileStatus::kReady));
  static_assert(!CanTransition(FileStatus::kReady, FileStatus::kUploading));
  static_assert(!CanTransition(FileStatus::kReady, FileStatus::kFailed));
  static_assert(!IsTerminal(FileStatus::kFailed));
  static_assert(IsTerminal(FileStatus::kDeleted));
}

void TestSessionTransitions() {
  static_assert(CanTransition(SessionStatus::kActive, SessionStatus::kCompleted));
  static_assert(CanTransition(SessionStatus::kActive, SessionStatus::kExpired));
  static_assert(!CanTransition(SessionStatus::kCompleted, SessionStatus::kActive));
  static_assert(!CanTransition(SessionStatus::kExpired, SessionStatus::kFailed));
  static_assert(IsWritable(SessionStatus::kActive));
  static_assert(!IsWritable(SessionStatus::kFailed));
}

void TestVariantPresets() {
  auto thumb = VariantPreset(VariantKind::kThumbnail);
  assert(thumb.width == 150u && thumb.height == 150u);
  assert(thumb.crop == std::string("fill"));

  auto medium = VariantPreset(VariantKind::kMedium);
  assert(medium.width == 600u);
  assert(!medium.height.has_value());

  auto webp = VariantPreset(VariantKind::kWebp);
  assert(webp.format == std::string("webp"));
  assert(webp.quality == 90u);

  auto compressed = VariantPreset(VariantKind::kCompressed);
  assert(compressed.progressive);
  assert(!compressed.width.has_value());
}

void TestNames() {
  assert(ToString(FileStatus::kProcessing) == "processing");
  assert(ToString(VariantKind::kXLarge) == "xlarge");
  assert(ParseVariantKind("thumbnail") == VariantKind::kThumbnail);
  assert(!ParseVariantKind("huge").has_value());
  assert(ParsePrivacy("public") == Privacy::kPublic);
  assert(ParseFileCategory("avatar") == FileCategory::kAvatar);
  assert(ParseFileStatus(ToString(FileStatus::kDeleted)) == FileStatus::kDeleted);
  assert(ParseTypeCategory("archive") == TypeCategory::kArchive);
}

} // namespace

int main() {
  TestCategoryFromMime();
  TestPriorities();
  TestFileTransitions();
  TestSessionTransitions();
  TestVariantPresets();
  TestNames();

  std::cout << "ingest_manager_unit_model: pass\n";
  return 0;
}
