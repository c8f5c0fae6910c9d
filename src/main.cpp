// src/main.cpp
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "core/metadata/InitDb.hpp"
#include "services/Backends.hpp"
#include "services/Config.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

// ASSETS_SCHEMA_PATH, else schema.sql in CWD (the build copies it there),
// else the source tree.
static std::string findSchemaPath(const ams::ServiceConfig& cfg) {
  namespace fs = std::filesystem;
  if (!cfg.schemaPath.empty()) return cfg.schemaPath;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/metadata/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (set ASSETS_SCHEMA_PATH)");
}

static void setupLogging(const std::string& levelName) {
  const auto level = spdlog::level::from_str(levelName);
  if (level == spdlog::level::off && levelName != "off") {
    spdlog::warn("unknown ASSETS_LOG_LEVEL '{}', using info", levelName);
    spdlog::set_level(spdlog::level::info);
    return;
  }
  spdlog::set_level(level);
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create the SQLite schema (ASSETS_DB_PATH)\n"
            << "  " << argv0 << " --serve       # start HTTP server (ASSETS_PORT or 8080)\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    if (argc > 1 && std::string(argv[1]) == "--init") {
      const ams::ServiceConfig cfg = ams::loadConfigFromEnv();
      ams::initDatabase(cfg.dbPath, findSchemaPath(cfg));
      std::cout << "DB initialized at: " << cfg.dbPath << "\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--serve") {
      const ams::ServiceConfig cfg = ams::loadConfigFromEnv();
      setupLogging(cfg.logLevel);

      // Self-heal DB on startup (idempotent)
      if (cfg.assetStore == "sqlite") {
        ams::initDatabase(cfg.dbPath, findSchemaPath(cfg));
      }
      if (cfg.blobStore == "local") {
        std::filesystem::create_directories(std::filesystem::path(cfg.blobRoot) / cfg.blobContainer);
      }

      // Store handles live for the whole process and are shared by all requests.
      auto assets = ams::makeAssetStore(cfg);
      auto blobs = ams::makeBlobStore(cfg);

      ams::ServerOptions opts;
      opts.bind = cfg.bind;
      opts.port = cfg.port;
      opts.maxUploadBytes = cfg.maxUploadBytes;
      opts.threads = cfg.threads;

      ams::run_http_server(*assets, *blobs, opts);
      return 0;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
