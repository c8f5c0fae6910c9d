#include "CosmosAssetStore.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>

#include "core/Errors.hpp"
#include "core/azure/Auth.hpp"

using nlohmann::json;

namespace ams {

namespace {

constexpr const char* kApiVersion = "2018-12-31";
constexpr const char* kMaxItemCount = "1000";

// "dbs/a b/colls/c" -> "/dbs/a%20b/colls/c"
std::string link_to_path(const std::string& link) {
  std::string out;
  size_t pos = 0;
  while (pos <= link.size()) {
    auto slash = link.find('/', pos);
    if (slash == std::string::npos) slash = link.size();
    out += "/" + azure::percent_encode(link.substr(pos, slash - pos));
    pos = slash + 1;
  }
  return out;
}

std::string partition_key(const std::string& id) {
  return json::array({id}).dump();
}

} // namespace

CosmosAssetStore::CosmosAssetStore(CosmosConfig cfg) : cfg_(std::move(cfg)) {
  if (cfg_.endpoint.empty()) return;
  try {
    const auto ep = azure::split_endpoint(cfg_.endpoint);
    basePath_ = ep.basePath;
    pool_ = std::make_unique<azure::ClientPool>(ep.origin, cfg_.timeoutSeconds);
  } catch (const std::invalid_argument& e) {
    endpointError_ = std::string("invalid COSMOS_ENDPOINT: ") + e.what();
    spdlog::warn("{}", endpointError_);
  }
}

void CosmosAssetStore::ensureConfigured() const {
  std::string missing;
  auto need = [&](const std::string& v, const char* name) {
    if (v.empty()) missing += missing.empty() ? name : std::string(", ") + name;
  };
  need(cfg_.endpoint, "COSMOS_ENDPOINT");
  need(cfg_.key, "COSMOS_KEY");
  need(cfg_.database, "COSMOS_DATABASE");
  need(cfg_.container, "COSMOS_CONTAINER");
  if (!missing.empty()) {
    throw StoreError("Cosmos store is not configured (missing " + missing + ")");
  }
}

std::string CosmosAssetStore::collectionLink() const {
  return "dbs/" + cfg_.database + "/colls/" + cfg_.container;
}

std::string CosmosAssetStore::documentLink(const std::string& id) const {
  return collectionLink() + "/docs/" + id;
}

CosmosAssetStore::Reply CosmosAssetStore::send(const std::string& method,
                                               const std::string& resourceLink,
                                               const std::map<std::string, std::string>& headers,
                                               const std::string& body) const {
  ensureConfigured();
  if (!pool_) throw StoreError(endpointError_);

  // Collection-level calls (create, read feed) address "docs" under the
  // collection link; document-level calls address the document itself.
  const bool isFeed = resourceLink == collectionLink();
  const std::string path = basePath_ + link_to_path(resourceLink) + (isFeed ? "/docs" : "");

  const std::string date = azure::rfc1123_now();
  httplib::Headers h{
    {"authorization", azure::cosmos_auth_token(method, "docs", resourceLink, date, cfg_.key)},
    {"x-ms-date", date},
    {"x-ms-version", kApiVersion},
    {"Accept", "application/json"}
  };
  for (const auto& [k, v] : headers) h.emplace(k, v);

  auto client = pool_->acquire();
  httplib::Result res = [&] {
    if (method == "GET") return client->Get(path, h);
    if (method == "POST") return client->Post(path, h, body, "application/json");
    if (method == "PUT") return client->Put(path, h, body, "application/json");
    return client->Delete(path, h);
  }();
  if (!res) throw StoreError(azure::transport_error("Cosmos", res));

  Reply r;
  r.status = res->status;
  r.body = res->body;
  r.continuation = res->get_header_value("x-ms-continuation");
  return r;
}

void CosmosAssetStore::fail(const std::string& op, const Reply& r) const {
  std::string detail = r.body;
  try {
    const json j = json::parse(r.body);
    if (j.is_object() && j.contains("message") && j["message"].is_string()) {
      detail = j.value("code", std::string()) + ": " + j["message"].get<std::string>();
    }
  } catch (const json::exception&) {
    // not JSON; keep the raw body
  }
  throw StoreError("Cosmos " + op + " failed (HTTP " + std::to_string(r.status) + "): " + detail);
}

void CosmosAssetStore::create(const Asset& a) {
  const json doc = a;
  const Reply r = send("POST", collectionLink(),
                       {{"x-ms-documentdb-partitionkey", partition_key(a.id)}},
                       doc.dump());
  if (r.status == 201) return;
  if (r.status == 409) throw StoreError("asset " + a.id + " already exists");
  fail("create", r);
}

std::optional<Asset> CosmosAssetStore::read(const std::string& id) {
  const Reply r = send("GET", documentLink(id),
                       {{"x-ms-documentdb-partitionkey", partition_key(id)}});
  if (r.status == 404) return std::nullopt;
  if (r.status != 200) fail("read", r);
  try {
    return json::parse(r.body).get<Asset>();
  } catch (const json::exception& e) {
    throw StoreError(std::string("Cosmos read returned invalid JSON: ") + e.what());
  }
}

std::vector<Asset> CosmosAssetStore::readAll() {
  std::vector<Asset> out;
  std::string continuation;
  int pages = 0;
  do {
    std::map<std::string, std::string> h{{"x-ms-max-item-count", kMaxItemCount}};
    if (!continuation.empty()) h["x-ms-continuation"] = continuation;

    const Reply r = send("GET", collectionLink(), h);
    if (r.status != 200) fail("read feed", r);
    try {
      const json page = json::parse(r.body);
      for (const auto& doc : page.at("Documents")) out.push_back(doc.get<Asset>());
    } catch (const json::exception& e) {
      throw StoreError(std::string("Cosmos read feed returned invalid JSON: ") + e.what());
    }
    continuation = r.continuation;
    ++pages;
  } while (!continuation.empty());

  spdlog::debug("cosmos read feed: {} documents in {} page(s)", out.size(), pages);
  return out;
}

void CosmosAssetStore::replace(const Asset& a) {
  const json doc = a;
  const Reply r = send("PUT", documentLink(a.id),
                       {{"x-ms-documentdb-partitionkey", partition_key(a.id)}},
                       doc.dump());
  if (r.status == 200) return;
  if (r.status == 404) throw NotFound("asset " + a.id + " not found");
  fail("replace", r);
}

bool CosmosAssetStore::remove(const std::string& id) {
  const Reply r = send("DELETE", documentLink(id),
                       {{"x-ms-documentdb-partitionkey", partition_key(id)}});
  if (r.status == 204 || r.status == 200) return true;
  if (r.status == 404) return false;
  fail("delete", r);
}

} // namespace ams
