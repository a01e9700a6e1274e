#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ingest::model {

enum class VariantKind : std::uint8_t {
  kThumbnail  = 0,
  kSmall      = 1,
  kMedium     = 2,
  kLarge      = 3,
  kXLarge     = 4,
  kWebp       = 5,
  kAvif       = 6,
  kCompressed = 7,
};

/*
  Transformation requested from a provider.

  Unset fields are left to the provider.
*/
struct Transform {
  std::optional<uint32_t>    width;
  std::optional<uint32_t>    height;
  std::optional<uint32_t>    quality;
  std::optional<std::string> format;
  std::optional<std::string> crop;
  bool                       progressive = false;
};

Transform VariantPreset(VariantKind kind);

} // namespace ingest::model
