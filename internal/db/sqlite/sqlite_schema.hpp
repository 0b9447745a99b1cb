#pragma once

#include <memory>

#include "internal/db/sql/migrations.hpp"
#include "sqlite_db.hpp"

namespace codestaff::db::sqlite {

/*
  MigrationExecutor backed by the live SqliteDB connection.
*/
class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(std::shared_ptr<SqliteDB> db);

  void                       ExecuteSQL(const std::string& sql) override;
  std::optional<std::string> QueryText(const std::string& sql) override;
  bool                       TableExists(const std::string& table) override;

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace codestaff::db::sqlite
