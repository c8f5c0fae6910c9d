/**
 * @file sqlite_asset_store_test.cpp
 * @brief SqliteAssetStore CRUD against a throwaway database file
 */

#include <gtest/gtest.h>
#include <sqlite3.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <set>

#include "core/Errors.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/SqliteAssetStore.hpp"
#include "core/util/Ids.hpp"

using namespace ams;
namespace fs = std::filesystem;

class SqliteAssetStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("ams_sqlite_" + uuid4());
        dbPath = (dir / "assets.db").string();
        ASSERT_TRUE(initDatabase(dbPath, AMS_SCHEMA_PATH));
        store = std::make_unique<SqliteAssetStore>(dbPath);
    }

    void TearDown() override {
        store.reset();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    static Asset MakeAsset(const std::string &title) {
        Asset a;
        a.id = uuid4();
        a.title = title;
        a.description = "about " + title;
        a.blobUrl = "https://x/uploads/" + title + ".bin";
        a.blobKey = title + ".bin";
        a.created_at = utc_now_iso();
        return a;
    }

    fs::path dir;
    std::string dbPath;
    std::unique_ptr<SqliteAssetStore> store;
};

TEST_F(SqliteAssetStoreTest, CreateThenReadReturnsSameRecord) {
    const Asset a = MakeAsset("photo");
    store->create(a);

    auto got = store->read(a.id);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->id, a.id);
    EXPECT_EQ(got->title, a.title);
    EXPECT_EQ(got->description, a.description);
    EXPECT_EQ(got->blobUrl, a.blobUrl);
    EXPECT_EQ(got->blobKey, a.blobKey);
    EXPECT_EQ(got->created_at, a.created_at);
    EXPECT_FALSE(got->updated_at.has_value());
}

TEST_F(SqliteAssetStoreTest, ReadMissingIsEmpty) {
    EXPECT_FALSE(store->read("nope").has_value());
}

TEST_F(SqliteAssetStoreTest, CreateDuplicateIdFails) {
    const Asset a = MakeAsset("dup");
    store->create(a);
    EXPECT_THROW(store->create(a), StoreError);
}

TEST_F(SqliteAssetStoreTest, ReadAllReturnsEveryRecord) {
    std::set<std::string> ids;
    for (const char *t : {"a", "b", "c"}) {
        const Asset a = MakeAsset(t);
        store->create(a);
        ids.insert(a.id);
    }
    std::set<std::string> got;
    for (const auto &a : store->readAll()) got.insert(a.id);
    EXPECT_EQ(got, ids);
}

TEST_F(SqliteAssetStoreTest, ReplaceOverwritesAndKeepsUpdatedAt) {
    Asset a = MakeAsset("old");
    store->create(a);

    a.title = "new";
    a.updated_at = utc_now_iso();
    store->replace(a);

    auto got = store->read(a.id);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->title, "new");
    EXPECT_EQ(got->updated_at, a.updated_at);
}

TEST_F(SqliteAssetStoreTest, ReplaceMissingThrowsNotFound) {
    EXPECT_THROW(store->replace(MakeAsset("ghost")), NotFound);
}

TEST_F(SqliteAssetStoreTest, RemoveReportsWhetherRecordExisted) {
    const Asset a = MakeAsset("gone");
    store->create(a);
    EXPECT_TRUE(store->remove(a.id));
    EXPECT_FALSE(store->remove(a.id));
    EXPECT_FALSE(store->read(a.id).has_value());
}

TEST_F(SqliteAssetStoreTest, DataSurvivesReopen) {
    const Asset a = MakeAsset("durable");
    store->create(a);
    store = std::make_unique<SqliteAssetStore>(dbPath);
    EXPECT_TRUE(store->read(a.id).has_value());
}

TEST(SqliteAssetStoreOpenTest, MissingDatabaseFileFails) {
    const auto path = fs::temp_directory_path() / ("ams_missing_" + uuid4()) / "assets.db";
    EXPECT_THROW(SqliteAssetStore store(path.string()), StoreError);
}

TEST(InitDbTest, IsIdempotentAndRejectsMissingSchema) {
    const auto dir = fs::temp_directory_path() / ("ams_init_" + uuid4());
    const std::string db = (dir / "nested" / "assets.db").string();
    EXPECT_TRUE(initDatabase(db, AMS_SCHEMA_PATH));
    EXPECT_TRUE(initDatabase(db, AMS_SCHEMA_PATH));
    EXPECT_THROW(initDatabase(db, (dir / "no-such-schema.sql").string()), StoreError);
    std::error_code ec;
    fs::remove_all(dir, ec);
}

namespace {

/**
 * @brief Run a single-integer query on a database file
 */
int QueryInt(const std::string &dbPath, const char *sql) {
    sqlite3 *db = nullptr;
    EXPECT_EQ(sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE, nullptr), SQLITE_OK);
    sqlite3_stmt *st = nullptr;
    int value = -1;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) == SQLITE_OK && sqlite3_step(st) == SQLITE_ROW) {
        value = sqlite3_column_int(st, 0);
    }
    sqlite3_finalize(st);
    sqlite3_close(db);
    return value;
}

void ExecSql(const std::string &dbPath, const char *sql) {
    sqlite3 *db = nullptr;
    ASSERT_EQ(sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE, nullptr), SQLITE_OK);
    EXPECT_EQ(sqlite3_exec(db, sql, nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);
}

void WriteFile(const fs::path &path, const std::string &text) {
    std::ofstream out(path);
    out << text;
}

}  // namespace

class InitDbFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("ams_initdb_" + uuid4());
        fs::create_directories(dir);
        dbPath = (dir / "assets.db").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
    std::string dbPath;
};

TEST_F(InitDbFileTest, RecordsSchemaVersion) {
    ASSERT_TRUE(initDatabase(dbPath, AMS_SCHEMA_PATH));
    EXPECT_EQ(QueryInt(dbPath, "PRAGMA user_version;"), 1);
    EXPECT_EQ(QueryInt(dbPath, "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name='assets';"), 1);
}

TEST_F(InitDbFileTest, FailingScriptLeavesNothingBehind) {
    const fs::path schema = dir / "broken.sql";
    WriteFile(schema, "CREATE TABLE IF NOT EXISTS partial (x TEXT);\nTHIS IS NOT SQL;\n");

    EXPECT_THROW(initDatabase(dbPath, schema.string()), StoreError);
    EXPECT_EQ(QueryInt(dbPath, "SELECT COUNT(*) FROM sqlite_master WHERE name='partial';"), 0);
    EXPECT_EQ(QueryInt(dbPath, "PRAGMA user_version;"), 0);
}

TEST_F(InitDbFileTest, RefusesNewerSchemaVersion) {
    ASSERT_TRUE(initDatabase(dbPath, AMS_SCHEMA_PATH));
    ExecSql(dbPath, "PRAGMA user_version=7;");
    ASSERT_EQ(QueryInt(dbPath, "PRAGMA user_version;"), 7);

    EXPECT_THROW(initDatabase(dbPath, AMS_SCHEMA_PATH), StoreError);
}

TEST_F(InitDbFileTest, MissingSchemaDoesNotCreateDatabase) {
    EXPECT_THROW(initDatabase(dbPath, (dir / "absent.sql").string()), StoreError);
    EXPECT_FALSE(fs::exists(dbPath));
}
