#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>

namespace ams {

class AssetStore;
class BlobStore;

struct ServerOptions {
  std::string bind = "0.0.0.0";
  int port = 8080;                          // 0 picks a free port
  size_t maxUploadBytes = 100 * 1024 * 1024;
  int threads = 8;
};

// REST surface over the asset and blob stores.
//
//   POST   /api/assets         create
//   GET    /api/assets         list
//   GET    /api/assets/{id}    get
//   PUT    /api/assets/{id}    partial update
//   DELETE /api/assets/{id}    delete record and its blob
//   POST   /api/upload         raw body -> new blob
//   GET    /blobs/{container}/{name}
//   GET    /health
//
// Handlers run on httplib's worker pool and share nothing but the two
// store references, which must outlive the server.
class HttpServer {
public:
  HttpServer(AssetStore& assets, BlobStore& blobs, ServerOptions opts);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and serves on a background thread.
  bool start(std::string& error);

  // Binds and serves on the calling thread until stop().
  bool run(std::string& error);

  // Safe to call more than once.
  void stop();

  // Bound port; valid after a successful start()/run().
  int port() const { return port_; }

private:
  bool bind(std::string& error);
  void setupRoutes();

  void handleCreateAsset(const httplib::Request& req, httplib::Response& res);
  void handleGetAsset(const httplib::Request& req, httplib::Response& res);
  void handleListAssets(const httplib::Request& req, httplib::Response& res);
  void handleUpdateAsset(const httplib::Request& req, httplib::Response& res);
  void handleDeleteAsset(const httplib::Request& req, httplib::Response& res);
  void handleUpload(const httplib::Request& req, httplib::Response& res);
  void handleGetBlob(const httplib::Request& req, httplib::Response& res);

  AssetStore& assets_;
  BlobStore& blobs_;
  ServerOptions opts_;
  int port_ = 0;

  std::unique_ptr<httplib::Server> server_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

// Start a blocking HTTP server. Throws std::runtime_error if it cannot bind.
void run_http_server(AssetStore& assets, BlobStore& blobs, const ServerOptions& opts);

} // namespace ams
