#include "Backends.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

#include "core/metadata/CosmosAssetStore.hpp"
#include "core/metadata/SqliteAssetStore.hpp"
#include "core/storage/AzureBlobBackend.hpp"
#include "core/storage/LocalFSBackend.hpp"

namespace ams {

std::unique_ptr<AssetStore> makeAssetStore(const ServiceConfig& cfg) {
  if (cfg.assetStore == "cosmos") {
    spdlog::info("asset store: cosmos ({}, {}/{})",
                 cfg.cosmos.endpoint.empty() ? "<no endpoint>" : cfg.cosmos.endpoint,
                 cfg.cosmos.database, cfg.cosmos.container);
    return std::make_unique<CosmosAssetStore>(cfg.cosmos);
  }
  if (cfg.assetStore == "sqlite") {
    spdlog::info("asset store: sqlite ({})", cfg.dbPath);
    return std::make_unique<SqliteAssetStore>(cfg.dbPath);
  }
  throw std::invalid_argument("unknown ASSETS_STORE '" + cfg.assetStore + "' (expected cosmos or sqlite)");
}

std::unique_ptr<BlobStore> makeBlobStore(const ServiceConfig& cfg) {
  if (cfg.blobStore == "azure") {
    spdlog::info("blob store: azure (container {})", cfg.blobContainer);
    return std::make_unique<AzureBlobBackend>(cfg.blobConnectionString, cfg.blobContainer);
  }
  if (cfg.blobStore == "local") {
    const std::string publicUrl = effectivePublicBlobUrl(cfg);
    spdlog::info("blob store: local ({}/{}, served at {})", cfg.blobRoot, cfg.blobContainer, publicUrl);
    return std::make_unique<LocalFSBackend>(cfg.blobRoot, cfg.blobContainer, publicUrl);
  }
  throw std::invalid_argument("unknown ASSETS_BLOB_STORE '" + cfg.blobStore + "' (expected azure or local)");
}

} // namespace ams
