#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace ingest::util {

// Lowercased extension including the dot, or "" when there is none.
std::string FileExtension(std::string_view filename);

// Stem with every character outside [A-Za-z0-9_-] replaced by '_'.
std::string SanitizeStem(std::string_view filename);

std::string RandomSuffix(std::size_t length = 6);

/*
  Collision-resistant storage name:

      <sanitized stem>_<epoch ms>_<6 random base36>.<ext>
*/
std::string GenerateStoredFilename(std::string_view original_name, uint64_t now_ms);

// Same as GenerateStoredFilename with an explicit suffix (deterministic for tests).
std::string GenerateStoredFilename(std::string_view original_name, uint64_t now_ms, std::string_view suffix);

} // namespace ingest::util
