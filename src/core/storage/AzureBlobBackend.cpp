#include "AzureBlobBackend.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

#include "core/Errors.hpp"

namespace ams {

namespace {

constexpr const char* kApiVersion = "2021-08-06";

// Content-Type and Content-Length are written by httplib itself.
httplib::Headers to_request_headers(const std::map<std::string, std::string>& h) {
  httplib::Headers out;
  for (const auto& [k, v] : h) {
    if (k == "Content-Type" || k == "Content-Length") continue;
    out.emplace(k, v);
  }
  return out;
}

std::string error_detail(const httplib::Result& res) {
  std::string code = res->get_header_value("x-ms-error-code");
  if (code.empty()) code = res->reason;
  return "HTTP " + std::to_string(res->status) + " " + code;
}

} // namespace

AzureBlobBackend::AzureBlobBackend(const std::string& connectionString, std::string container,
                                   int timeoutSeconds)
  : container_(std::move(container)), timeoutSeconds_(timeoutSeconds) {
  if (connectionString.empty()) {
    connError_ = "BLOB_CONNECTION_STRING is not configured";
    return;
  }
  try {
    conn_ = azure::parse_connection_string(connectionString);
    const auto ep = azure::split_endpoint(conn_->blobEndpoint);
    origin_ = ep.origin;
    basePath_ = ep.basePath;
    pool_ = std::make_unique<azure::ClientPool>(origin_, timeoutSeconds_);
  } catch (const std::invalid_argument& e) {
    conn_.reset();
    connError_ = std::string("invalid BLOB_CONNECTION_STRING: ") + e.what();
    spdlog::warn("{}", connError_);
  }
}

const azure::StorageConnection& AzureBlobBackend::connection() const {
  if (!conn_) throw StoreError(connError_);
  return *conn_;
}

std::string AzureBlobBackend::blobPath(const std::string& name) const {
  connection();  // throws when the connection string was unusable
  return basePath_ + "/" + azure::percent_encode(container_) + "/" + azure::percent_encode(name);
}

// Under SAS auth the token is part of the URL, so the link stays fetchable.
std::string AzureBlobBackend::urlFor(const std::string& name) const {
  const std::string url = origin_ + blobPath(name);
  const auto& sas = connection().sas;
  return sas.empty() ? url : url + "?" + sas;
}

std::string AzureBlobBackend::authorize(const std::string& verb,
                                        const std::string& path,
                                        std::map<std::string, std::string>& headers) const {
  const auto& c = connection();
  headers["x-ms-date"] = azure::rfc1123_now();
  headers["x-ms-version"] = kApiVersion;

  if (!c.sas.empty()) return path + "?" + c.sas;

  const std::string sts = azure::blob_string_to_sign(verb, headers, c.accountName, path);
  headers["Authorization"] = azure::blob_shared_key(c.accountName, c.accountKey, sts);
  return path;
}

std::string AzureBlobBackend::upload(const std::string& name,
                                     std::string_view bytes,
                                     const std::string& content_type,
                                     bool overwrite) {
  std::map<std::string, std::string> h{
    {"x-ms-blob-type", "BlockBlob"},
    {"Content-Type", content_type},
    {"Content-Length", std::to_string(bytes.size())}
  };
  if (!overwrite) h["If-None-Match"] = "*";

  const std::string path = authorize("PUT", blobPath(name), h);
  auto client = pool_->acquire();
  auto res = client->Put(path, to_request_headers(h), std::string(bytes), content_type);
  if (!res) throw StoreError(azure::transport_error("Blob", res));
  if (res->status == 409 && !overwrite) throw StoreError("blob already exists: " + name);
  if (res->status != 201) throw StoreError("Blob upload failed: " + error_detail(res));
  return urlFor(name);
}

std::optional<StoredBlob> AzureBlobBackend::download(const std::string& name) {
  std::map<std::string, std::string> h;
  const std::string path = authorize("GET", blobPath(name), h);
  auto client = pool_->acquire();
  auto res = client->Get(path, to_request_headers(h));
  if (!res) throw StoreError(azure::transport_error("Blob", res));
  if (res->status == 404) return std::nullopt;
  if (res->status != 200) throw StoreError("Blob download failed: " + error_detail(res));

  StoredBlob blob;
  blob.bytes = res->body;
  blob.content_type = res->get_header_value("Content-Type");
  if (blob.content_type.empty()) blob.content_type = "application/octet-stream";
  return blob;
}

bool AzureBlobBackend::remove(const std::string& name) {
  std::map<std::string, std::string> h;
  const std::string path = authorize("DELETE", blobPath(name), h);
  auto client = pool_->acquire();
  auto res = client->Delete(path, to_request_headers(h));
  if (!res) throw StoreError(azure::transport_error("Blob", res));
  if (res->status == 202) return true;
  if (res->status == 404) return false;
  throw StoreError("Blob delete failed: " + error_detail(res));
}

} // namespace ams
