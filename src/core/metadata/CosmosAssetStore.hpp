#pragma once
#include <map>
#include <memory>
#include <string>

#include "AssetStore.hpp"
#include "core/azure/HttpClient.hpp"

namespace ams {

struct CosmosConfig {
  std::string endpoint;    // https://<account>.documents.azure.com:443/
  std::string key;         // master key, base64
  std::string database;
  std::string container;   // partition key path must be /id
  int timeoutSeconds = 30;
};

// Asset documents in an Azure Cosmos DB (SQL API) container, spoken to over
// the REST interface with master-key authorization.
//
// One client pool per store: connections to the account endpoint are opened
// lazily and kept alive across requests. Construction never fails: missing
// settings are reported by the first call that needs them.
class CosmosAssetStore : public AssetStore {
public:
  explicit CosmosAssetStore(CosmosConfig cfg);

  void create(const Asset& a) override;
  std::optional<Asset> read(const std::string& id) override;
  std::vector<Asset> readAll() override;
  void replace(const Asset& a) override;
  bool remove(const std::string& id) override;

private:
  struct Reply {
    int status = 0;
    std::string body;
    std::string continuation;
  };

  // resourceLink is the unencoded "dbs/<db>/colls/<coll>[/docs/<id>]";
  // the request path is derived from it.
  Reply send(const std::string& method,
             const std::string& resourceLink,
             const std::map<std::string, std::string>& headers,
             const std::string& body = {}) const;

  void ensureConfigured() const;
  std::string collectionLink() const;
  std::string documentLink(const std::string& id) const;
  [[noreturn]] void fail(const std::string& op, const Reply& r) const;

  CosmosConfig cfg_;
  std::string basePath_;
  std::string endpointError_;
  std::unique_ptr<azure::ClientPool> pool_;
};

} // namespace ams
