#include "upload_policy.hpp"

#include "internal/util/encoding.hpp"
#include "internal/util/errors.hpp"

namespace ingest::core {

bool MimeAllowed(const std::vector<std::string>& allowed, std::string_view mime_type) {
  const auto mime = util::ToLower(mime_type);
  for (const auto& entry : allowed) {
    const auto pattern = util::ToLower(entry);
    if (pattern.size() >= 2 && pattern.compare(pattern.size() - 2, 2, "/*") == 0) {
      if (mime.compare(0, pattern.size() - 1, pattern, 0, pattern.size() - 1) == 0 && mime.size() > pattern.size() - 1) return true;
    } else if (mime == pattern) {
      return true;
    }
  }
  return false;
}

void CheckUploadPolicy(const UploadPolicy& policy, uint64_t size_bytes, std::string_view mime_type) {
  if (size_bytes > policy.max_file_size) {
    throw util::Rejected("file size " + std::to_string(size_bytes) + " exceeds maximum of " + std::to_string(policy.max_file_size) +
                         " bytes");
  }
  if (!MimeAllowed(policy.allowed_mime_types, mime_type)) {
    throw util::Rejected("file type " + std::string(mime_type) + " is not allowed");
  }
}

} // namespace ingest::core
