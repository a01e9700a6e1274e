#include "variant.hpp"

namespace ingest::model {

Transform VariantPreset(VariantKind kind) {
  Transform transform;
  switch (kind) {
    case VariantKind::kThumbnail:
      transform.width  = 150;
      transform.height = 150;
      transform.crop   = "fill";
      break;
    case VariantKind::kSmall:
      transform.width = 300;
      transform.crop  = "limit";
      break;
    case VariantKind::kMedium:
      transform.width = 600;
      transform.crop  = "limit";
      break;
    case VariantKind::kLarge:
      transform.width = 1200;
      transform.crop  = "limit";
      break;
    case VariantKind::kXLarge:
      transform.width = 1920;
      transform.crop  = "limit";
      break;
    case VariantKind::kWebp:
      transform.format  = "webp";
      transform.quality = 90;
      break;
    case VariantKind::kAvif:
      transform.format  = "avif";
      transform.quality = 80;
      break;
    case VariantKind::kCompressed:
      transform.quality     = 60;
      transform.progressive = true;
      break;
  }
  return transform;
}

} // namespace ingest::model
