#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/http/http_client.hpp"
#include "internal/storage/provider_router.hpp"

namespace ingest::storage {

/*
  Builds the configured providers and the router over them.

  Core uses this as:

      auto router = StorageFactory::Build(config.providers(), http);
      router->Choose(category)->Upload(...)
*/

class StorageFactory {
 public:
  static std::shared_ptr<ProviderRouter> Build(const ingest::runtime::config::ProvidersConfig& cfg,
                                               std::shared_ptr<http::HttpClient>               http);

  static StorageProviderPtr BuildObjectStore(const ingest::runtime::config::ProvidersConfig& cfg);
};

} // namespace ingest::storage
