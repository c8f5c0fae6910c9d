#pragma once
#include <string>

#include "core/metadata/CosmosAssetStore.hpp"

namespace ams {

// Process configuration, read once from the environment at startup.
struct ServiceConfig {
  // Backends: "cosmos" | "sqlite" and "azure" | "local".
  std::string assetStore = "cosmos";
  std::string blobStore = "azure";

  CosmosConfig cosmos;

  std::string blobConnectionString;
  std::string blobContainer = "uploads";

  std::string dbPath = "data/assets.db";
  std::string schemaPath;        // empty: search CWD, then the source tree
  std::string blobRoot = "data/blobs";
  std::string publicBlobUrl;     // empty: http://localhost:<port>/blobs

  std::string bind = "0.0.0.0";
  int port = 8080;
  size_t maxUploadBytes = 100 * 1024 * 1024;
  int threads = 8;
  std::string logLevel = "info";
};

std::string get_env_or(const char* key, const std::string& defval);

ServiceConfig loadConfigFromEnv();

// Base URL used for local blob URLs.
std::string effectivePublicBlobUrl(const ServiceConfig& cfg);

} // namespace ams
