#pragma once
#include <memory>

#include "Config.hpp"
#include "core/metadata/AssetStore.hpp"
#include "core/storage/BlobStore.hpp"

namespace ams {

// Constructs the configured store handles. Throws std::invalid_argument for
// an unknown backend name; otherwise incomplete settings are left for the
// first request to report.
std::unique_ptr<AssetStore> makeAssetStore(const ServiceConfig& cfg);
std::unique_ptr<BlobStore> makeBlobStore(const ServiceConfig& cfg);

} // namespace ams
