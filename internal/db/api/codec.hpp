#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <string_view>

namespace ingest::db {

// "0,1,5" <-> {0,1,5}; used for the uploaded_chunks column.
inline std::string EncodeChunkSet(const std::set<uint64_t>& chunks) {
  std::string out;
  for (auto index : chunks) {
    if (!out.empty()) out.push_back(',');
    out += std::to_string(index);
  }
  return out;
}

inline std::set<uint64_t> DecodeChunkSet(std::string_view text) {
  std::set<uint64_t> chunks;
  uint64_t           value     = 0;
  bool               has_value = false;
  for (char c : text) {
    if (c >= '0' && c <= '9') {
      value     = value * 10 + static_cast<uint64_t>(c - '0');
      has_value = true;
    } else if (c == ',') {
      if (has_value) chunks.insert(value);
      value     = 0;
      has_value = false;
    }
  }
  if (has_value) chunks.insert(value);
  return chunks;
}

} // namespace ingest::db
