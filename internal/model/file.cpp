#include "file.hpp"

namespace ingest::model {

TypeCategory CategoryFromMime(std::string_view mime_type) {
  if (mime_type.starts_with("image/")) return TypeCategory::kImage;
  if (mime_type.starts_with("video/")) return TypeCategory::kVideo;
  if (mime_type.starts_with("audio/")) return TypeCategory::kAudio;

  if (mime_type.find("pdf") != std::string_view::npos || mime_type.find("document") != std::string_view::npos ||
      mime_type.starts_with("text/")) {
    return TypeCategory::kDocument;
  }

  if (mime_type.find("zip") != std::string_view::npos || mime_type.find("rar") != std::string_view::npos ||
      mime_type.find("tar") != std::string_view::npos) {
    return TypeCategory::kArchive;
  }

  return TypeCategory::kOther;
}

} // namespace ingest::model
