#include "Config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <stdexcept>

namespace ams {

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

namespace {

template <typename T>
T env_number_or(const char* key, T defval) {
  const std::string raw = get_env_or(key, "");
  if (raw.empty()) return defval;
  try {
    size_t used = 0;
    const long long v = std::stoll(raw, &used);
    if (used != raw.size() || v <= 0) throw std::invalid_argument(raw);
    return static_cast<T>(v);
  } catch (const std::exception&) {
    spdlog::warn("ignoring invalid {}='{}', using {}", key, raw, defval);
    return defval;
  }
}

} // namespace

ServiceConfig loadConfigFromEnv() {
  ServiceConfig c;
  c.assetStore = get_env_or("ASSETS_STORE", c.assetStore);
  c.blobStore  = get_env_or("ASSETS_BLOB_STORE", c.blobStore);

  c.cosmos.endpoint  = get_env_or("COSMOS_ENDPOINT", "");
  c.cosmos.key       = get_env_or("COSMOS_KEY", "");
  c.cosmos.database  = get_env_or("COSMOS_DATABASE", "");
  c.cosmos.container = get_env_or("COSMOS_CONTAINER", "");

  c.blobConnectionString = get_env_or("BLOB_CONNECTION_STRING", "");
  c.blobContainer        = get_env_or("BLOB_CONTAINER", c.blobContainer);

  c.dbPath        = get_env_or("ASSETS_DB_PATH", c.dbPath);
  c.schemaPath    = get_env_or("ASSETS_SCHEMA_PATH", c.schemaPath);
  c.blobRoot      = get_env_or("ASSETS_BLOB_ROOT", c.blobRoot);
  c.publicBlobUrl = get_env_or("ASSETS_PUBLIC_URL", c.publicBlobUrl);

  c.bind           = get_env_or("ASSETS_BIND", c.bind);
  c.port           = env_number_or<int>("ASSETS_PORT", c.port);
  c.maxUploadBytes = env_number_or<size_t>("ASSETS_MAX_UPLOAD_BYTES", c.maxUploadBytes);
  c.threads        = env_number_or<int>("ASSETS_THREADS", c.threads);
  c.logLevel       = get_env_or("ASSETS_LOG_LEVEL", c.logLevel);
  return c;
}

std::string effectivePublicBlobUrl(const ServiceConfig& cfg) {
  if (!cfg.publicBlobUrl.empty()) return cfg.publicBlobUrl;
  return "http://localhost:" + std::to_string(cfg.port) + "/blobs";
}

} // namespace ams
