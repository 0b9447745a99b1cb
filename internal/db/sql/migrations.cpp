#include "internal/db/sql/migrations.hpp"

#include <algorithm>
#include <cctype>

#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace codestaff::db::sql {

using codestaff::util::SchemaError;
namespace obs = codestaff::observability;

namespace {

// Runs `sql` inside one transaction; on failure rolls back and rethrows as SchemaError.
void RunAtomically(MigrationExecutor& executor, const std::string& sql, const std::string& what) {
  try {
    executor.ExecuteSQL("BEGIN IMMEDIATE;");
  } catch (const std::exception& e) {
    throw SchemaError(what + ": begin failed: " + e.what());
  }

  try {
    executor.ExecuteSQL(sql);
    executor.ExecuteSQL("COMMIT;");
  } catch (const std::exception& e) {
    try {
      executor.ExecuteSQL("ROLLBACK;");
    } catch (const std::exception& rollback_error) {
      CODESTAFF_LOG_ERROR("schema rollback failed", {obs::StringField("step", what), obs::StringField("error", rollback_error.what())});
    }
    throw SchemaError(what + ": " + e.what());
  }
}

int ReadVersion(MigrationExecutor& executor) {
  std::optional<std::string> text;
  try {
    text = executor.QueryText("SELECT \"value\" FROM \"meta\" WHERE \"key\" = 'version';");
  } catch (const std::exception& e) {
    throw SchemaError(std::string("read schema version: ") + e.what());
  }

  if (!text) {
    throw SchemaError("meta table present but meta['version'] is missing");
  }

  auto version = ParseSchemaVersion(*text);
  if (!version) {
    throw SchemaError("unrecognized schema version '" + *text + "'");
  }
  return *version;
}

} // namespace

const std::vector<Migration>& Migrations() {
  static const std::vector<Migration> kMigrations = {
      {1, kMigrateV1ToV2},
  };
  return kMigrations;
}

std::optional<int> ParseSchemaVersion(const std::string& text) {
  if (text.empty() || text.size() > 9) return std::nullopt;
  if (!std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return std::nullopt;
  }

  const int version = std::stoi(text);
  if (version <= 0) return std::nullopt;
  return version;
}

int EnsureSchema(MigrationExecutor& executor) {
  bool has_meta = false;
  try {
    has_meta = executor.TableExists("meta");
  } catch (const std::exception& e) {
    throw SchemaError(std::string("store unreachable: ") + e.what());
  }

  if (!has_meta) {
    RunAtomically(executor, kCreateV2, "create schema v" + std::to_string(kSchemaVersionCurrent));
    CODESTAFF_LOG_INFO("created database schema", {obs::IntField("version", kSchemaVersionCurrent)});
    return kSchemaVersionCurrent;
  }

  int version = ReadVersion(executor);
  if (version > kSchemaVersionCurrent) {
    throw SchemaError("schema version " + std::to_string(version) + " is newer than supported version " +
                      std::to_string(kSchemaVersionCurrent));
  }

  while (version < kSchemaVersionCurrent) {
    const auto& steps = Migrations();
    auto        step  = std::find_if(steps.begin(), steps.end(), [&](const Migration& m) { return m.from_version == version; });
    if (step == steps.end()) {
      throw SchemaError("no migration path from schema version " + std::to_string(version));
    }

    const auto what = "migrate v" + std::to_string(version) + " -> v" + std::to_string(version + 1);
    CODESTAFF_LOG_INFO("applying schema migration", {obs::IntField("from", version), obs::IntField("to", version + 1)});
    RunAtomically(executor, step->sql, what);

    const int next = ReadVersion(executor);
    if (next <= version) {
      throw SchemaError(what + ": version marker did not advance");
    }
    version = next;
  }

  return version;
}

} // namespace codestaff::db::sql
