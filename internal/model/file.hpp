#pragma once

#include <cstdint>
#include <string_view>

namespace ingest::model {

enum class TypeCategory : std::uint8_t {
  kOther    = 0,
  kImage    = 1,
  kVideo    = 2,
  kAudio    = 3,
  kDocument = 4,
  kArchive  = 5,
};

enum class FileStatus : std::uint8_t {
  kUploading  = 0,
  kProcessing = 1,
  kReady      = 2,
  kFailed     = 3,
  kDeleted    = 4,
};

enum class Privacy : std::uint8_t {
  kPublic    = 0,
  kPrivate   = 1,
  kProtected = 2,
};

// Business tag supplied by the caller.
enum class FileCategory : std::uint8_t {
  kContent    = 0,
  kProfile    = 1,
  kDocument   = 2,
  kMedia      = 3,
  kAttachment = 4,
  kAvatar     = 5,
  kBanner     = 6,
};

TypeCategory CategoryFromMime(std::string_view mime_type);

// Queue priority of the accept job; lower runs first.
constexpr int UploadPriority(TypeCategory category) {
  switch (category) {
    case TypeCategory::kImage:
      return 1;
    case TypeCategory::kVideo:
      return 2;
    case TypeCategory::kDocument:
      return 3;
    default:
      return 5;
  }
}

constexpr bool IsPubliclyReadable(Privacy privacy) {
  return privacy == Privacy::kPublic;
}

} // namespace ingest::model
