#pragma once

#include <optional>
#include <string>
#include <vector>

namespace codestaff::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements the executor; EnsureSchema() drives it.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // First column of the first row, nullopt when there is no row.
  virtual std::optional<std::string> QueryText(const std::string& sql) = 0;

  virtual bool TableExists(const std::string& table) = 0;
};

/*
  A single forward step from `from_version` to `from_version + 1`.
  The step's SQL must advance meta['version'] itself.
*/
struct Migration {
  int         from_version;
  std::string sql;
};

// Ordered, one entry per version older than current.
const std::vector<Migration>& Migrations();

/*
  Creates the current schema on an empty store, or applies the registered
  steps one transaction at a time until the stored version is current.

  Returns the resulting version. Throws util::SchemaError on DDL failure,
  unknown or newer versions, missing steps and unreachable stores.
*/
int EnsureSchema(MigrationExecutor& executor);

// Parses meta['version']; nullopt when it is not a plain positive integer.
std::optional<int> ParseSchemaVersion(const std::string& text);

} // namespace codestaff::db::sql
