#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/file.hpp"

namespace ingest::db {

struct FileFilter {
  std::string                                owner_id;
  std::optional<ingest::model::FileStatus>   status;
  std::optional<ingest::model::TypeCategory> type_category;
  std::optional<ingest::model::FileCategory> category;
  bool                                       include_deleted = false;
};

struct Page {
  uint32_t limit  = 50;
  uint32_t offset = 0;
};

} // namespace ingest::db
