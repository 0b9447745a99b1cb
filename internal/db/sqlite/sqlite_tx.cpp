#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace codestaff::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (committed_ || !db_->IsOpen()) return;

  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    CODESTAFF_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
}

} // namespace codestaff::db::sqlite
