#include "names.hpp"

#include <array>
#include <utility>

namespace ingest::model {

namespace {

template <typename Enum, std::size_t N>
std::string_view Lookup(const std::array<std::pair<Enum, std::string_view>, N>& table, Enum value) {
  for (const auto& [candidate, name] : table) {
    if (candidate == value) return name;
  }
  return "unknown";
}

template <typename Enum, std::size_t N>
std::optional<Enum> Reverse(const std::array<std::pair<Enum, std::string_view>, N>& table, std::string_view name) {
  for (const auto& [candidate, candidate_name] : table) {
    if (candidate_name == name) return candidate;
  }
  return std::nullopt;
}

constexpr std::array<std::pair<TypeCategory, std::string_view>, 6> kTypeCategories{{
    {TypeCategory::kOther, "other"},
    {TypeCategory::kImage, "image"},
    {TypeCategory::kVideo, "video"},
    {TypeCategory::kAudio, "audio"},
    {TypeCategory::kDocument, "document"},
    {TypeCategory::kArchive, "archive"},
}};

constexpr std::array<std::pair<FileStatus, std::string_view>, 5> kFileStatuses{{
    {FileStatus::kUploading, "uploading"},
    {FileStatus::kProcessing, "processing"},
    {FileStatus::kReady, "ready"},
    {FileStatus::kFailed, "failed"},
    {FileStatus::kDeleted, "deleted"},
}};

constexpr std::array<std::pair<Privacy, std::string_view>, 3> kPrivacies{{
    {Privacy::kPublic, "public"},
    {Privacy::kPrivate, "private"},
    {Privacy::kProtected, "protected"},
}};

constexpr std::array<std::pair<FileCategory, std::string_view>, 7> kFileCategories{{
    {FileCategory::kContent, "content"},
    {FileCategory::kProfile, "profile"},
    {FileCategory::kDocument, "document"},
    {FileCategory::kMedia, "media"},
    {FileCategory::kAttachment, "attachment"},
    {FileCategory::kAvatar, "avatar"},
    {FileCategory::kBanner, "banner"},
}};

constexpr std::array<std::pair<SessionStatus, std::string_view>, 4> kSessionStatuses{{
    {SessionStatus::kActive, "active"},
    {SessionStatus::kCompleted, "completed"},
    {SessionStatus::kFailed, "failed"},
    {SessionStatus::kExpired, "expired"},
}};

constexpr std::array<std::pair<VariantKind, std::string_view>, 8> kVariantKinds{{
    {VariantKind::kThumbnail, "thumbnail"},
    {VariantKind::kSmall, "small"},
    {VariantKind::kMedium, "medium"},
    {VariantKind::kLarge, "large"},
    {VariantKind::kXLarge, "xlarge"},
    {VariantKind::kWebp, "webp"},
    {VariantKind::kAvif, "avif"},
    {VariantKind::kCompressed, "compressed"},
}};

constexpr std::array<std::pair<ProviderKind, std::string_view>, 3> kProviderKinds{{
    {ProviderKind::kNone, "none"},
    {ProviderKind::kTransform, "transform"},
    {ProviderKind::kObjectStore, "object_store"},
}};

} // namespace

std::string_view ToString(TypeCategory value) {
  return Lookup(kTypeCategories, value);
}

std::string_view ToString(FileStatus value) {
  return Lookup(kFileStatuses, value);
}

std::string_view ToString(Privacy value) {
  return Lookup(kPrivacies, value);
}

std::string_view ToString(FileCategory value) {
  return Lookup(kFileCategories, value);
}

std::string_view ToString(SessionStatus value) {
  return Lookup(kSessionStatuses, value);
}

std::string_view ToString(VariantKind value) {
  return Lookup(kVariantKinds, value);
}

std::string_view ToString(ProviderKind value) {
  return Lookup(kProviderKinds, value);
}

std::optional<Privacy> ParsePrivacy(std::string_view value) {
  return Reverse(kPrivacies, value);
}

std::optional<FileCategory> ParseFileCategory(std::string_view value) {
  return Reverse(kFileCategories, value);
}

std::optional<VariantKind> ParseVariantKind(std::string_view value) {
  return Reverse(kVariantKinds, value);
}

std::optional<FileStatus> ParseFileStatus(std::string_view value) {
  return Reverse(kFileStatuses, value);
}

std::optional<TypeCategory> ParseTypeCategory(std::string_view value) {
  return Reverse(kTypeCategories, value);
}

} // namespace ingest::model
