#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "BlobStore.hpp"
#include "core/azure/Auth.hpp"
#include "core/azure/HttpClient.hpp"

namespace ams {

// Blobs in one Azure Blob Storage container, spoken to over the REST
// interface with SharedKey or SAS authorization taken from a connection
// string. The container must already exist. Requests share one pool of
// keep-alive clients for the blob endpoint.
//
// Construction never fails: an empty or malformed connection string is
// reported by the first call.
class AzureBlobBackend : public BlobStore {
public:
  AzureBlobBackend(const std::string& connectionString, std::string container,
                   int timeoutSeconds = 60);

  std::string upload(const std::string& name,
                     std::string_view bytes,
                     const std::string& content_type,
                     bool overwrite) override;
  std::optional<StoredBlob> download(const std::string& name) override;
  bool remove(const std::string& name) override;
  std::string urlFor(const std::string& name) const override;
  const std::string& container() const override { return container_; }

private:
  const azure::StorageConnection& connection() const;
  std::string blobPath(const std::string& name) const;

  // Adds x-ms-date/x-ms-version and authorization, returns the path to
  // request (with the SAS query appended when SAS auth is in use).
  std::string authorize(const std::string& verb,
                        const std::string& path,
                        std::map<std::string, std::string>& headers) const;

  std::optional<azure::StorageConnection> conn_;
  std::string connError_;
  std::string origin_;
  std::string basePath_;
  std::unique_ptr<azure::ClientPool> pool_;
  std::string container_;
  int timeoutSeconds_;
};

} // namespace ams
