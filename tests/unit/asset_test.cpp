/**
 * @file asset_test.cpp
 * @brief Asset document mapping, blob key derivation, id and timestamp format
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <set>

#include "core/Asset.hpp"
#include "core/util/Ids.hpp"

using namespace ams;
using nlohmann::json;
using testing::MatchesRegex;

TEST(AssetTest, BlobKeyIsLastPathSegment) {
    EXPECT_EQ(blob_key_from_url("https://acct.blob.core.windows.net/uploads/abc.bin"), "abc.bin");
    EXPECT_EQ(blob_key_from_url("https://x/uploads/abc.bin?sv=2020&sig=x"), "abc.bin");
    EXPECT_EQ(blob_key_from_url("https://x/uploads/abc.bin#frag"), "abc.bin");
    EXPECT_EQ(blob_key_from_url("abc.bin"), "abc.bin");
    EXPECT_EQ(blob_key_from_url("https://x/uploads/"), "");
    EXPECT_EQ(blob_key_from_url(""), "");
}

TEST(AssetTest, ResolveBlobKeyPrefersStoredKey) {
    Asset a;
    a.blobUrl = "https://x/uploads/from-url.bin";
    EXPECT_EQ(resolve_blob_key(a), "from-url.bin");
    a.blobKey = "stored.bin";
    EXPECT_EQ(resolve_blob_key(a), "stored.bin");
}

TEST(AssetTest, JsonOmitsUpdatedAtUntilSet) {
    Asset a;
    a.id = "1";
    a.title = "t";
    a.blobUrl = "u";
    a.created_at = "2024-01-01T00:00:00.000000Z";

    json j = a;
    EXPECT_EQ(j, json({{"id", "1"},
                       {"title", "t"},
                       {"description", ""},
                       {"blobUrl", "u"},
                       {"blobKey", ""},
                       {"created_at", "2024-01-01T00:00:00.000000Z"}}));

    a.updated_at = "2024-01-02T00:00:00.000000Z";
    j = a;
    EXPECT_EQ(j["updated_at"], "2024-01-02T00:00:00.000000Z");
}

TEST(AssetTest, FromJsonIgnoresStoreSystemProperties) {
    const json doc = json::parse(R"({
        "id": "42", "title": "Photo", "blobUrl": "https://x/uploads/p.bin",
        "created_at": "2024-01-01T00:00:00.000000Z",
        "_rid": "abc==", "_etag": "\"0000\"", "_ts": 1700000000
    })");
    const Asset a = doc.get<Asset>();
    EXPECT_EQ(a.id, "42");
    EXPECT_EQ(a.title, "Photo");
    EXPECT_EQ(a.description, "");
    EXPECT_EQ(a.blobKey, "");
    EXPECT_FALSE(a.updated_at.has_value());
    EXPECT_FALSE(json(a).contains("_rid"));
}

TEST(IdsTest, Uuid4IsCanonicalAndUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        const std::string id = uuid4();
        ASSERT_THAT(id, MatchesRegex("[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}"));
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(IdsTest, UtcTimestampIsFixedWidthIso8601) {
    const std::string a = utc_now_iso();
    const std::string b = utc_now_iso();
    EXPECT_THAT(a, MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:[0-9]{2}\\.[0-9]{6}Z"));
    EXPECT_LE(a, b);
}
