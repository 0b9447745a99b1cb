#pragma once

#include <sqlite3.h>

#include <optional>
#include <string>

namespace codestaff::db::sqlite {

/*
  Thin RAII wrapper around the single sqlite3* connection.

  The connection is owned by whoever holds this object; the coordinator
  is the only holder once startup completes.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool IsOpen() const {
    return db_ != nullptr;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // First column of the first row, nullopt when no row or NULL.
  std::optional<std::string> QueryText(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

  // Close the connection; throws when sqlite refuses.
  void Close();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace codestaff::db::sqlite
