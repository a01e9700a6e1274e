#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ingest::core {

/*
  Content inspection run before an upload is accepted.

  SniffMimeType looks at magic bytes only; nullopt means "unknown",
  which is not a mismatch (plain text, CSV and friends have no magic).
*/

std::optional<std::string> SniffMimeType(std::string_view content);

// True when the sniffed type is the declared one or a known alias of it.
bool MimeCompatible(std::string_view declared, std::string_view sniffed);

inline constexpr std::size_t kScriptScanBytes = 1024;

// First suspicious pattern in the leading kScriptScanBytes, if any.
std::optional<std::string> FindSuspiciousPattern(std::string_view content);

} // namespace ingest::core
