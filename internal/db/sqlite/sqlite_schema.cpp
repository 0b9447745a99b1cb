#include "sqlite_schema.hpp"

#include "internal/util/errors.hpp"

namespace codestaff::db::sqlite {

SqliteMigrationExecutor::SqliteMigrationExecutor(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteMigrationExecutor::ExecuteSQL(const std::string& sql) {
  db_->Exec(sql);
}

std::optional<std::string> SqliteMigrationExecutor::QueryText(const std::string& sql) {
  return db_->QueryText(sql);
}

bool SqliteMigrationExecutor::TableExists(const std::string& table) {
  sqlite3_stmt* st = db_->Prepare("SELECT 1 FROM sqlite_master WHERE type='table' AND name=?;");
  sqlite3_bind_text(st, 1, table.c_str(), -1, SQLITE_TRANSIENT);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    std::string msg = sqlite3_errmsg(db_->Handle());
    sqlite3_finalize(st);
    throw util::StoreError("sqlite_master lookup: " + msg);
  }

  sqlite3_finalize(st);
  return rc == SQLITE_ROW;
}

} // namespace codestaff::db::sqlite
