#include "InitDb.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

#include "core/Errors.hpp"

namespace ams {

namespace {

constexpr int kSchemaVersion = 1;

struct DbCloser {
  void operator()(sqlite3* db) const { sqlite3_close(db); }
};
using DbHandle = std::unique_ptr<sqlite3, DbCloser>;

void exec_sql(sqlite3* db, const std::string& sql, const char* what) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db);
    sqlite3_free(err);
    throw StoreError(std::string(what) + " failed: " + msg);
  }
}

std::string read_schema(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw StoreError("cannot open schema file: " + path);
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

int user_version(sqlite3* db) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "PRAGMA user_version;", -1, &st, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw StoreError("reading user_version failed: " + err);
  }
  const int v = sqlite3_step(st) == SQLITE_ROW ? sqlite3_column_int(st, 0) : 0;
  sqlite3_finalize(st);
  return v;
}

DbHandle open_db(const std::string& dbPath) {
  sqlite3* raw = nullptr;
  const int rc = sqlite3_open_v2(dbPath.c_str(), &raw,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
  DbHandle db(raw);
  if (rc != SQLITE_OK) {
    throw StoreError("failed to open db " + dbPath + ": " +
                     (raw ? sqlite3_errmsg(raw) : "out of memory"));
  }
  return db;
}

} // namespace

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
  // Read the script before touching the database file.
  const std::string schema = read_schema(schemaPath);

  const auto parent = std::filesystem::path(dbPath).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  DbHandle db = open_db(dbPath);

  // journal_mode cannot change inside a transaction
  exec_sql(db.get(), "PRAGMA journal_mode=WAL;", "enabling WAL");
  exec_sql(db.get(), "PRAGMA synchronous=NORMAL;", "setting synchronous");
  sqlite3_busy_timeout(db.get(), 5000);

  const int before = user_version(db.get());
  if (before > kSchemaVersion) {
    throw StoreError("database " + dbPath + " has schema version " + std::to_string(before) +
                     ", newer than supported version " + std::to_string(kSchemaVersion));
  }

  exec_sql(db.get(), "BEGIN IMMEDIATE;", "starting schema transaction");
  try {
    exec_sql(db.get(), schema, "applying schema");
    exec_sql(db.get(), "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";",
             "recording schema version");
    exec_sql(db.get(), "COMMIT;", "committing schema");
  } catch (const StoreError&) {
    if (sqlite3_exec(db.get(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      spdlog::error("Rollback of schema transaction failed: {}", sqlite3_errmsg(db.get()));
    }
    throw;
  }

  if (before == 0) {
    spdlog::info("Created schema v{} in {}", kSchemaVersion, dbPath);
  } else {
    spdlog::info("Schema v{} already present in {}", before, dbPath);
  }
  return true;
}

} // namespace ams
