#pragma once

#include <map>
#include <string>

namespace ingest::model {

// Open key/value map carried by sessions, files and variants.
using Metadata = std::map<std::string, std::string>;

inline void Merge(Metadata& into, const Metadata& from) {
  for (const auto& [key, value] : from) {
    into[key] = value;
  }
}

} // namespace ingest::model
