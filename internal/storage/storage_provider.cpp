#include "storage_provider.hpp"

#include <algorithm>

#include "internal/model/names.hpp"
#include "internal/util/errors.hpp"

namespace ingest::storage {

bool StorageProvider::Supports(model::TypeCategory category) const {
  const auto& types = SupportedTypes();
  return std::find(types.begin(), types.end(), category) != types.end();
}

void StorageProvider::CheckUploadable(model::TypeCategory category, uint64_t size_bytes) const {
  if (!Supports(category)) {
    throw util::UnsupportedType(std::string(model::ToString(Kind())) + " does not accept " + std::string(model::ToString(category)));
  }
  if (size_bytes > MaxFileSize()) {
    throw util::TooLarge(std::to_string(size_bytes) + " bytes exceeds " + std::string(model::ToString(Kind())) + " limit of " +
                         std::to_string(MaxFileSize()));
  }
}

} // namespace ingest::storage
