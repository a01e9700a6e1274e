#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace ingest::util {

/*
  UUID helpers

  Sessions, files, variants and jobs are keyed by RFC4122 v4 UUIDs in
  their canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

std::string NewId();

} // namespace ingest::util
