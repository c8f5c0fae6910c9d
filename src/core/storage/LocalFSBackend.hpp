#pragma once
#include <string>
#include <string_view>

#include "BlobStore.hpp"

namespace ams {

// Blobs as plain files under <root>/<container>/<name>; the content type
// of each blob is kept in <root>/<container>/.meta/<name>.
// Public URLs are <publicBaseUrl>/<container>/<name>, served by the
// /blobs route of the HTTP server.
class LocalFSBackend : public BlobStore {
public:
  LocalFSBackend(std::string root, std::string container, std::string publicBaseUrl);

  std::string upload(const std::string& name,
                     std::string_view bytes,
                     const std::string& content_type,
                     bool overwrite) override;
  std::optional<StoredBlob> download(const std::string& name) override;
  bool remove(const std::string& name) override;
  std::string urlFor(const std::string& name) const override;
  const std::string& container() const override { return container_; }

private:
  std::string root_;
  std::string container_;
  std::string publicBaseUrl_;
};

} // namespace ams
