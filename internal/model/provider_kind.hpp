#pragma once

#include <cstdint>

namespace ingest::model {

/*
  Closed set of storage providers.

    kTransform   : image/video service with native transformations
    kObjectStore : general purpose object storage, no transformations
*/
enum class ProviderKind : std::uint8_t {
  kNone        = 0,
  kTransform   = 1,
  kObjectStore = 2,
};

} // namespace ingest::model
