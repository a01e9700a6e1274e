#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ingest::core {

struct UploadPolicy {
  uint64_t                 max_file_size       = 100ULL * 1024 * 1024;
  std::vector<std::string> allowed_mime_types  = {"image/*", "video/*", "application/pdf"};
  bool                     strict_content_type = false;
};

// Exact match, or "type/*" prefix match.
bool MimeAllowed(const std::vector<std::string>& allowed, std::string_view mime_type);

// Throws util::Rejected for an oversized file or a mime type off the allow-list.
void CheckUploadPolicy(const UploadPolicy& policy, uint64_t size_bytes, std::string_view mime_type);

} // namespace ingest::core
