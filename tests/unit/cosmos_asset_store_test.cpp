/**
 * @file cosmos_asset_store_test.cpp
 * @brief CosmosAssetStore against a loopback Cosmos DB REST endpoint
 *
 * Covers:
 * - request shape: resource paths, partition key, auth and version headers
 * - status mapping for create/read/replace/remove
 * - read feed following x-ms-continuation
 * - keep-alive connection reuse across calls
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "core/Errors.hpp"
#include "core/metadata/CosmosAssetStore.hpp"
#include "fakes/fake_service.hpp"

using namespace ams;
using namespace ams::tests;
using namespace testing;
using nlohmann::json;

namespace {

const char *kDocsPath = "/dbs/db/colls/assets/docs";

json stored_doc(const std::string &id) {
    return {{"id", id},
            {"title", "Stored " + id},
            {"description", ""},
            {"blobUrl", "https://acct.blob.core.windows.net/uploads/" + id + ".bin"},
            {"blobKey", id + ".bin"},
            {"created_at", "2024-01-01T00:00:00.000000Z"},
            {"_rid", "rid-" + id},
            {"_etag", "\"etag\""},
            {"_ts", 1704067200}};
}

void reply_json(httplib::Response &res, int status, const json &body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

/**
 * @brief Minimal Cosmos behavior keyed on document ids
 *
 * create: "dup" conflicts. read: "missing" is absent, "boom" fails.
 * replace: "gone" is absent. remove: "a1" -> 204, "old" -> 200, else 404.
 * read feed: two pages joined by the continuation token "page-2".
 */
void cosmos_responder(const httplib::Request &req, httplib::Response &res) {
    const bool feed = req.path == kDocsPath;
    const std::string id = last_segment(req.path);

    if (req.method == "POST" && feed) {
        const json doc = json::parse(req.body);
        if (doc.value("id", "") == "dup") {
            reply_json(res, 409, {{"code", "Conflict"}, {"message", "Entity with the specified id already exists"}});
            return;
        }
        reply_json(res, 201, doc);
        return;
    }
    if (req.method == "GET" && feed) {
        const std::string token = req.get_header_value("x-ms-continuation");
        if (token.empty()) {
            res.set_header("x-ms-continuation", "page-2");
            reply_json(res, 200, {{"Documents", {stored_doc("p1a"), stored_doc("p1b")}}, {"_count", 2}});
        } else {
            reply_json(res, 200, {{"Documents", {stored_doc("p2a")}}, {"_count", 1}});
        }
        return;
    }
    if (req.method == "GET") {
        if (id == "missing") {
            reply_json(res, 404, {{"code", "NotFound"}, {"message", "Resource Not Found"}});
        } else if (id == "boom") {
            reply_json(res, 503, {{"code", "ServiceUnavailable"}, {"message", "try later"}});
        } else {
            reply_json(res, 200, stored_doc(id));
        }
        return;
    }
    if (req.method == "PUT") {
        if (id == "gone") {
            reply_json(res, 404, {{"code", "NotFound"}, {"message", "Resource Not Found"}});
        } else {
            reply_json(res, 200, json::parse(req.body));
        }
        return;
    }
    if (req.method == "DELETE") {
        if (id == "a1") {
            res.status = 204;
        } else if (id == "old") {
            res.status = 200;
        } else {
            reply_json(res, 404, {{"code", "NotFound"}, {"message", "Resource Not Found"}});
        }
        return;
    }
    res.status = 405;
}

Asset sample_asset(const std::string &id) {
    Asset a;
    a.id = id;
    a.title = "Photo";
    a.description = "d";
    a.blobUrl = "https://acct.blob.core.windows.net/uploads/" + id + ".bin";
    a.blobKey = id + ".bin";
    a.created_at = "2024-05-01T10:00:00.000000Z";
    return a;
}

}  // namespace

class CosmosAssetStoreTest : public Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(service.running()) << "fake Cosmos endpoint did not start";
        CosmosConfig cfg;
        cfg.endpoint = service.url() + "/";
        cfg.key = "c2VjcmV0LWtleQ==";
        cfg.database = "db";
        cfg.container = "assets";
        cfg.timeoutSeconds = 5;
        store = std::make_unique<CosmosAssetStore>(cfg);
    }

    FakeService service{cosmos_responder};
    std::unique_ptr<CosmosAssetStore> store;
};

TEST_F(CosmosAssetStoreTest, CreatePostsDocumentWithPartitionKey) {
    store->create(sample_asset("a1"));

    const auto reqs = service.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, "POST");
    EXPECT_EQ(reqs[0].path, kDocsPath);
    EXPECT_EQ(reqs[0].header("x-ms-documentdb-partitionkey"), R"(["a1"])");
    EXPECT_EQ(reqs[0].header("x-ms-version"), "2018-12-31");
    EXPECT_FALSE(reqs[0].header("x-ms-date").empty());
    EXPECT_THAT(reqs[0].header("authorization"), StartsWith("type%3Dmaster%26ver%3D1.0%26sig%3D"));
    EXPECT_THAT(reqs[0].header("Content-Type"), HasSubstr("application/json"));

    const json body = json::parse(reqs[0].body);
    EXPECT_EQ(body["id"], "a1");
    EXPECT_EQ(body["blobKey"], "a1.bin");
    EXPECT_FALSE(body.contains("updated_at"));
}

TEST_F(CosmosAssetStoreTest, CreateConflictIsStoreError) {
    try {
        store->create(sample_asset("dup"));
        FAIL() << "expected StoreError";
    } catch (const StoreError &e) {
        EXPECT_THAT(e.what(), HasSubstr("already exists"));
    }
}

TEST_F(CosmosAssetStoreTest, ReadReturnsDocumentWithoutSystemProperties) {
    auto a = store->read("a7");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->id, "a7");
    EXPECT_EQ(a->title, "Stored a7");
    EXPECT_EQ(a->blobKey, "a7.bin");
    EXPECT_FALSE(a->updated_at.has_value());

    const auto reqs = service.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, "GET");
    EXPECT_EQ(reqs[0].path, std::string(kDocsPath) + "/a7");
    EXPECT_EQ(reqs[0].header("x-ms-documentdb-partitionkey"), R"(["a7"])");
}

TEST_F(CosmosAssetStoreTest, ReadMissingDocumentIsEmpty) {
    EXPECT_FALSE(store->read("missing").has_value());
}

TEST_F(CosmosAssetStoreTest, ReadServiceErrorCarriesCosmosMessage) {
    try {
        store->read("boom");
        FAIL() << "expected StoreError";
    } catch (const StoreError &e) {
        EXPECT_THAT(e.what(), HasSubstr("503"));
        EXPECT_THAT(e.what(), HasSubstr("ServiceUnavailable: try later"));
    }
}

TEST_F(CosmosAssetStoreTest, ReadAllFollowsContinuationAcrossPages) {
    const auto all = store->readAll();

    std::vector<std::string> ids;
    for (const auto &a : all) ids.push_back(a.id);
    EXPECT_THAT(ids, ElementsAre("p1a", "p1b", "p2a"));

    const auto reqs = service.requests();
    ASSERT_EQ(reqs.size(), 2u);
    for (const auto &r : reqs) {
        EXPECT_EQ(r.method, "GET");
        EXPECT_EQ(r.path, kDocsPath);
        EXPECT_EQ(r.header("x-ms-max-item-count"), "1000");
    }
    EXPECT_EQ(reqs[0].header("x-ms-continuation"), "");
    EXPECT_EQ(reqs[1].header("x-ms-continuation"), "page-2");
}

TEST_F(CosmosAssetStoreTest, ReplacePutsFullDocument) {
    Asset a = sample_asset("a2");
    a.title = "Renamed";
    a.updated_at = "2024-05-02T10:00:00.000000Z";
    store->replace(a);

    const auto reqs = service.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, "PUT");
    EXPECT_EQ(reqs[0].path, std::string(kDocsPath) + "/a2");
    EXPECT_EQ(reqs[0].header("x-ms-documentdb-partitionkey"), R"(["a2"])");
    const json body = json::parse(reqs[0].body);
    EXPECT_EQ(body["title"], "Renamed");
    EXPECT_EQ(body["updated_at"], "2024-05-02T10:00:00.000000Z");
    EXPECT_EQ(body["created_at"], "2024-05-01T10:00:00.000000Z");
}

TEST_F(CosmosAssetStoreTest, ReplaceMissingDocumentIsNotFound) {
    EXPECT_THROW(store->replace(sample_asset("gone")), NotFound);
}

TEST_F(CosmosAssetStoreTest, RemoveMapsStatusToResult) {
    EXPECT_TRUE(store->remove("a1"));    // 204
    EXPECT_TRUE(store->remove("old"));   // 200
    EXPECT_FALSE(store->remove("nope"));  // 404

    const auto reqs = service.requests();
    ASSERT_EQ(reqs.size(), 3u);
    EXPECT_EQ(reqs[0].method, "DELETE");
    EXPECT_EQ(reqs[0].header("x-ms-documentdb-partitionkey"), R"(["a1"])");
    EXPECT_EQ(reqs[2].header("x-ms-documentdb-partitionkey"), R"(["nope"])");
}

TEST_F(CosmosAssetStoreTest, SequentialCallsReuseOneConnection) {
    ASSERT_TRUE(store->read("r1").has_value());
    ASSERT_TRUE(store->read("r2").has_value());
    EXPECT_TRUE(store->remove("a1"));

    const auto reqs = service.requests();
    ASSERT_EQ(reqs.size(), 3u);
    EXPECT_EQ(reqs[1].remote_port, reqs[0].remote_port);
    EXPECT_EQ(reqs[2].remote_port, reqs[0].remote_port);
}

TEST(CosmosAssetStoreConfigTest, InvalidEndpointFailsOnFirstCall) {
    CosmosConfig cfg;
    cfg.endpoint = "not-a-url";
    cfg.key = "c2VjcmV0LWtleQ==";
    cfg.database = "db";
    cfg.container = "assets";
    CosmosAssetStore store(cfg);

    try {
        store.read("x");
        FAIL() << "expected StoreError";
    } catch (const StoreError &e) {
        EXPECT_THAT(e.what(), HasSubstr("COSMOS_ENDPOINT"));
    }
}
