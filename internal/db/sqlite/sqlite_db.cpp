#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace codestaff::db::sqlite {

using codestaff::util::StoreError;

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw StoreError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw StoreError("sqlite open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close_v2(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  if (!db_) throw StoreError("sqlite exec: connection closed");

  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw StoreError(msg);
  }
}

std::optional<std::string> SqliteDB::QueryText(const std::string& sql) {
  sqlite3_stmt* stmt = Prepare(sql);

  std::optional<std::string> out;
  int                        rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    if (const unsigned char* text = sqlite3_column_text(stmt, 0)) {
      out = reinterpret_cast<const char*>(text);
    }
  } else if (rc != SQLITE_DONE) {
    std::string msg = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    throw StoreError("sqlite step: " + msg);
  }

  sqlite3_finalize(stmt);
  return out;
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  if (!db_) throw StoreError("sqlite prepare: connection closed");

  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  // WAL keeps a crash mid-write from corrupting the main file
  Exec("PRAGMA journal_mode=WAL;");

  // FULL: every committed request survives power loss
  Exec("PRAGMA synchronous=FULL;");

  // wait for locks instead of failing immediately (external readers)
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::Close() {
  if (!db_) return;

  int rc = sqlite3_close(db_);
  if (rc != SQLITE_OK) {
    throw StoreError(std::string("sqlite close: ") + sqlite3_errmsg(db_));
  }
  db_ = nullptr;
}

} // namespace codestaff::db::sqlite
