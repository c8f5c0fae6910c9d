#include "HttpServer.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/Asset.hpp"
#include "core/Errors.hpp"
#include "core/metadata/AssetStore.hpp"
#include "core/storage/BlobStore.hpp"
#include "core/util/Ids.hpp"

using nlohmann::json;

// -------- helpers --------

namespace {

constexpr const char* kAssetNotFound = "Asset not found";
constexpr const char* kDefaultContentType = "application/octet-stream";

void send_text(httplib::Response& res, int status, const std::string& body) {
  res.status = status;
  res.set_content(body, "text/plain");
}

void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

// Runs a handler body and maps exceptions to status codes:
// BadRequest -> 400, NotFound -> 404, anything else -> 500 with its message.
template <typename F>
void guarded(const char* op, httplib::Response& res, F&& fn) {
  try {
    fn();
  } catch (const ams::BadRequest& e) {
    send_text(res, 400, e.what());
  } catch (const ams::NotFound&) {
    send_text(res, 404, kAssetNotFound);
  } catch (const std::exception& e) {
    spdlog::error("{} failed: {}", op, e.what());
    send_text(res, 500, e.what());
  }
}

json parse_object(const httplib::Request& req) {
  json j;
  try {
    j = json::parse(req.body);
  } catch (const json::parse_error&) {
    throw ams::BadRequest("invalid JSON body");
  }
  if (!j.is_object()) throw ams::BadRequest("JSON body must be an object");
  return j;
}

// Present-and-string, absent, or BadRequest for any other type.
std::optional<std::string> string_field(const json& j, const char* k) {
  auto it = j.find(k);
  if (it == j.end()) return std::nullopt;
  if (!it->is_string()) throw ams::BadRequest(std::string(k) + " must be a string");
  return it->get<std::string>();
}

} // namespace

// -------- server --------

namespace ams {

HttpServer::HttpServer(AssetStore& assets, BlobStore& blobs, ServerOptions opts)
  : assets_(assets), blobs_(blobs), opts_(std::move(opts)) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::bind(std::string& error) {
  if (running_.load()) {
    error = "server already running";
    return false;
  }

  server_ = std::make_unique<httplib::Server>();
  const int threads = opts_.threads;
  server_->new_task_queue = [threads] { return new httplib::ThreadPool(static_cast<size_t>(threads)); };
  server_->set_payload_max_length(opts_.maxUploadBytes);

  server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
  });

  setupRoutes();

  // Fallback
  server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    if (res.status == 404) res.set_content("not found", "text/plain");
    else if (res.status == 413) res.set_content("payload too large", "text/plain");
  });

  server_->set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                    std::exception_ptr ep) {
    std::string msg = "unknown error";
    try {
      std::rethrow_exception(std::move(ep));
    } catch (const std::exception& e) {
      msg = e.what();
    } catch (...) {
      msg = "unknown exception";
    }
    spdlog::error("{} {} raised: {}", req.method, req.path, msg);
    send_text(res, 500, msg);
  });

  if (opts_.port == 0) {
    port_ = server_->bind_to_any_port(opts_.bind);
    if (port_ < 0) {
      error = "failed to bind " + opts_.bind + " to any port";
      return false;
    }
  } else {
    if (!server_->bind_to_port(opts_.bind, opts_.port)) {
      error = "failed to bind " + opts_.bind + ":" + std::to_string(opts_.port);
      return false;
    }
    port_ = opts_.port;
  }
  running_.store(true);
  spdlog::info("HTTP server listening on http://{}:{}", opts_.bind, port_);
  return true;
}

bool HttpServer::start(std::string& error) {
  if (!bind(error)) return false;
  thread_ = std::thread([this] { server_->listen_after_bind(); });
  // stop() is a no-op until the accept loop is running
  for (int i = 0; i < 200 && !server_->is_running(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

bool HttpServer::run(std::string& error) {
  if (!bind(error)) return false;
  server_->listen_after_bind();
  running_.store(false);
  return true;
}

void HttpServer::stop() {
  if (server_) server_->stop();
  if (thread_.joinable()) thread_.join();
  if (running_.exchange(false)) spdlog::info("HTTP server stopped");
}

void HttpServer::setupRoutes() {
  // Health check
  server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
    send_text(res, 200, "ok");
  });

  server_->Post("/api/assets", [this](const httplib::Request& req, httplib::Response& res) {
    handleCreateAsset(req, res);
  });
  server_->Get("/api/assets", [this](const httplib::Request& req, httplib::Response& res) {
    handleListAssets(req, res);
  });
  server_->Get(R"(/api/assets/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
    handleGetAsset(req, res);
  });
  server_->Put(R"(/api/assets/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
    handleUpdateAsset(req, res);
  });
  server_->Delete(R"(/api/assets/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
    handleDeleteAsset(req, res);
  });

  // Body: raw bytes of the file; Content-Type is stored with the blob.
  server_->Post("/api/upload", [this](const httplib::Request& req, httplib::Response& res) {
    handleUpload(req, res);
  });

  server_->Get(R"(/blobs/([^/]+)/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
    handleGetBlob(req, res);
  });
}

// POST /api/assets
// Body: {"title": ..., "blobUrl": ..., "description"?: ...}
void HttpServer::handleCreateAsset(const httplib::Request& req, httplib::Response& res) {
  guarded("create asset", res, [&] {
    const json j = parse_object(req);
    auto title = string_field(j, "title");
    auto blobUrl = string_field(j, "blobUrl");
    if (!title || !blobUrl) throw BadRequest("title and blobUrl are required");

    Asset a;
    a.id          = uuid4();
    a.title       = std::move(*title);
    a.description = string_field(j, "description").value_or("");
    a.blobUrl     = std::move(*blobUrl);
    a.blobKey     = blob_key_from_url(a.blobUrl);
    a.created_at  = utc_now_iso();

    assets_.create(a);
    spdlog::info("created asset {} (blob {})", a.id, a.blobKey);
    send_json(res, 201, a);
  });
}

void HttpServer::handleGetAsset(const httplib::Request& req, httplib::Response& res) {
  guarded("get asset", res, [&] {
    const std::string id = req.matches[1];
    auto a = assets_.read(id);
    if (!a) throw NotFound(id);
    send_json(res, 200, *a);
  });
}

void HttpServer::handleListAssets(const httplib::Request&, httplib::Response& res) {
  guarded("list assets", res, [&] {
    send_json(res, 200, json(assets_.readAll()));
  });
}

// PUT /api/assets/{id}
// Supplied fields replace stored ones; everything else is kept.
void HttpServer::handleUpdateAsset(const httplib::Request& req, httplib::Response& res) {
  guarded("update asset", res, [&] {
    const std::string id = req.matches[1];
    const json j = parse_object(req);
    auto title = string_field(j, "title");
    auto description = string_field(j, "description");
    auto blobUrl = string_field(j, "blobUrl");

    auto a = assets_.read(id);
    if (!a) throw NotFound(id);

    if (title) a->title = std::move(*title);
    if (description) a->description = std::move(*description);
    if (blobUrl && *blobUrl != a->blobUrl) {
      a->blobUrl = std::move(*blobUrl);
      a->blobKey = blob_key_from_url(a->blobUrl);
    }
    a->updated_at = utc_now_iso();

    assets_.replace(*a);
    send_json(res, 200, *a);
  });
}

// DELETE /api/assets/{id}
// Blob first, then the record. The two deletes are not atomic: if the
// record delete fails the blob is already gone and the record dangles.
void HttpServer::handleDeleteAsset(const httplib::Request& req, httplib::Response& res) {
  guarded("delete asset", res, [&] {
    const std::string id = req.matches[1];
    auto a = assets_.read(id);
    if (!a) throw NotFound(id);

    const std::string key = resolve_blob_key(*a);
    if (!is_safe_blob_name(key)) {
      spdlog::warn("asset {}: no usable blob name in blobUrl '{}', skipping blob delete", id, a->blobUrl);
    } else if (!blobs_.remove(key)) {
      spdlog::warn("asset {}: blob {} was already absent", id, key);
    }

    bool removed = false;
    try {
      removed = assets_.remove(id);
    } catch (const std::exception& e) {
      spdlog::error("asset {}: blob {} deleted but record delete failed: {}", id, key, e.what());
      throw;
    }
    if (!removed) throw NotFound(id);

    spdlog::info("deleted asset {} (blob {})", id, key);
    res.status = 204;
  });
}

// POST /api/upload
void HttpServer::handleUpload(const httplib::Request& req, httplib::Response& res) {
  guarded("upload", res, [&] {
    if (req.body.empty()) throw BadRequest("Empty file");

    std::string contentType = req.get_header_value("Content-Type");
    if (contentType.empty()) contentType = kDefaultContentType;

    const std::string filename = uuid4() + ".bin";
    const std::string url = blobs_.upload(filename, req.body, contentType, /*overwrite*/ true);
    spdlog::info("uploaded {} ({} bytes, {})", filename, req.body.size(), contentType);

    send_json(res, 201, json{{"filename", filename}, {"url", url}});
  });
}

// GET /blobs/{container}/{name}
void HttpServer::handleGetBlob(const httplib::Request& req, httplib::Response& res) {
  guarded("get blob", res, [&] {
    const std::string container = req.matches[1];
    const std::string name = req.matches[2];
    if (container != blobs_.container() || !is_safe_blob_name(name)) {
      send_text(res, 404, "not found");
      return;
    }
    auto blob = blobs_.download(name);
    if (!blob) {
      send_text(res, 404, "not found");
      return;
    }
    res.status = 200;
    res.set_content(blob->bytes, blob->content_type);
  });
}

void run_http_server(AssetStore& assets, BlobStore& blobs, const ServerOptions& opts) {
  HttpServer server(assets, blobs, opts);
  std::string error;
  if (!server.run(error)) {
    spdlog::error("{}", error);
    throw std::runtime_error(error);
  }
}

} // namespace ams
