#pragma once
#include <string>

#include "AssetStore.hpp"

struct sqlite3;

namespace ams {

// Asset documents in a local SQLite file (schema.sql must already be applied,
// see initDatabase). One connection in serialized mode, shared by all threads.
class SqliteAssetStore : public AssetStore {
public:
  explicit SqliteAssetStore(const std::string& dbPath);
  ~SqliteAssetStore() override;

  SqliteAssetStore(const SqliteAssetStore&) = delete;
  SqliteAssetStore& operator=(const SqliteAssetStore&) = delete;

  void create(const Asset& a) override;
  std::optional<Asset> read(const std::string& id) override;
  std::vector<Asset> readAll() override;
  void replace(const Asset& a) override;
  bool remove(const std::string& id) override;

private:
  sqlite3* db_;
};

} // namespace ams
