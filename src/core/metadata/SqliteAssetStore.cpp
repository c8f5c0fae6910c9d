#include "SqliteAssetStore.hpp"
#include <memory>
#include <sqlite3.h>

#include "core/Errors.hpp"

namespace ams {

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};
using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// Holds the connection's recursive mutex so that step, errmsg and changes
// observe the same statement.
class DbLock {
public:
  explicit DbLock(sqlite3* db) : m_(sqlite3_db_mutex(db)) { sqlite3_mutex_enter(m_); }
  ~DbLock() { sqlite3_mutex_leave(m_); }
  DbLock(const DbLock&) = delete;
  DbLock& operator=(const DbLock&) = delete;
private:
  sqlite3_mutex* m_;
};

Stmt prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw StoreError("prepare failed: " + err);
  }
  return Stmt(st);
}

void bind_text(sqlite3_stmt* st, int i, const std::string& v) {
  sqlite3_bind_text(st, i, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* st, int i) {
  const auto* p = sqlite3_column_text(st, i);
  if (!p) return {};
  return std::string(reinterpret_cast<const char*>(p),
                     static_cast<size_t>(sqlite3_column_bytes(st, i)));
}

// Column order must match kSelectColumns.
Asset row_to_asset(sqlite3_stmt* st) {
  Asset a;
  a.id          = column_text(st, 0);
  a.title       = column_text(st, 1);
  a.description = column_text(st, 2);
  a.blobUrl     = column_text(st, 3);
  a.blobKey     = column_text(st, 4);
  a.created_at  = column_text(st, 5);
  if (sqlite3_column_type(st, 6) != SQLITE_NULL) a.updated_at = column_text(st, 6);
  return a;
}

constexpr const char* kSelectColumns =
  "SELECT id, title, description, blob_url, blob_key, created_at, updated_at FROM assets";

} // namespace

SqliteAssetStore::SqliteAssetStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    std::string err = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw StoreError("failed to open db " + dbPath + ": " + err);
  }
  sqlite3_busy_timeout(db, 5000);
  db_ = db;
}

SqliteAssetStore::~SqliteAssetStore() {
  sqlite3_close(db_);
}

void SqliteAssetStore::create(const Asset& a) {
  DbLock lock(db_);
  const char* sql = R"SQL(
    INSERT INTO assets
      (id, title, description, blob_url, blob_key, created_at, updated_at)
    VALUES (?,?,?,?,?,?,?)
  )SQL";
  Stmt st = prepare(db_, sql);
  int i = 1;
  bind_text(st.get(), i++, a.id);
  bind_text(st.get(), i++, a.title);
  bind_text(st.get(), i++, a.description);
  bind_text(st.get(), i++, a.blobUrl);
  bind_text(st.get(), i++, a.blobKey);
  bind_text(st.get(), i++, a.created_at);
  if (a.updated_at) bind_text(st.get(), i++, *a.updated_at);
  else sqlite3_bind_null(st.get(), i++);

  if (sqlite3_step(st.get()) != SQLITE_DONE) {
    throw StoreError("create failed: " + std::string(sqlite3_errmsg(db_)));
  }
}

std::optional<Asset> SqliteAssetStore::read(const std::string& id) {
  DbLock lock(db_);
  Stmt st = prepare(db_, (std::string(kSelectColumns) + " WHERE id = ?").c_str());
  bind_text(st.get(), 1, id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return row_to_asset(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  throw StoreError("read failed: " + std::string(sqlite3_errmsg(db_)));
}

std::vector<Asset> SqliteAssetStore::readAll() {
  DbLock lock(db_);
  Stmt st = prepare(db_, (std::string(kSelectColumns) + " ORDER BY created_at, id").c_str());
  std::vector<Asset> out;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(row_to_asset(st.get()));
  }
  if (rc != SQLITE_DONE) {
    throw StoreError("readAll failed: " + std::string(sqlite3_errmsg(db_)));
  }
  return out;
}

void SqliteAssetStore::replace(const Asset& a) {
  DbLock lock(db_);
  const char* sql = R"SQL(
    UPDATE assets
       SET title = ?, description = ?, blob_url = ?, blob_key = ?,
           created_at = ?, updated_at = ?
     WHERE id = ?
  )SQL";
  Stmt st = prepare(db_, sql);
  int i = 1;
  bind_text(st.get(), i++, a.title);
  bind_text(st.get(), i++, a.description);
  bind_text(st.get(), i++, a.blobUrl);
  bind_text(st.get(), i++, a.blobKey);
  bind_text(st.get(), i++, a.created_at);
  if (a.updated_at) bind_text(st.get(), i++, *a.updated_at);
  else sqlite3_bind_null(st.get(), i++);
  bind_text(st.get(), i++, a.id);

  if (sqlite3_step(st.get()) != SQLITE_DONE) {
    throw StoreError("replace failed: " + std::string(sqlite3_errmsg(db_)));
  }
  if (sqlite3_changes(db_) == 0) {
    throw NotFound("asset " + a.id + " not found");
  }
}

bool SqliteAssetStore::remove(const std::string& id) {
  DbLock lock(db_);
  Stmt st = prepare(db_, "DELETE FROM assets WHERE id = ?");
  bind_text(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_DONE) {
    throw StoreError("remove failed: " + std::string(sqlite3_errmsg(db_)));
  }
  return sqlite3_changes(db_) > 0;
}

} // namespace ams
