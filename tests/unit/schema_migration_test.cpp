#include "internal/db/sql/migrations.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/util/errors.hpp"

namespace {

using codestaff::db::sql::EnsureSchema;
using codestaff::db::sql::kSchemaVersionCurrent;
using codestaff::db::sql::ParseSchemaVersion;
using codestaff::db::sqlite::SqliteDB;
using codestaff::db::sqlite::SqliteMigrationExecutor;
using codestaff::db::sqlite::SqliteRepository;
using codestaff::util::SchemaError;

std::shared_ptr<SqliteDB> OpenMemory() {
  return std::make_shared<SqliteDB>(":memory:");
}

bool EnsureThrows(const std::shared_ptr<SqliteDB>& db) {
  SqliteMigrationExecutor executor(db);
  try {
    (void)EnsureSchema(executor);
  } catch (const SchemaError&) {
    return true;
  }
  return false;
}

void TestFreshStoreGetsCurrentSchema() {
  auto                    db = OpenMemory();
  SqliteMigrationExecutor executor(db);

  assert(EnsureSchema(executor) == kSchemaVersionCurrent);
  assert(db->QueryText("SELECT value FROM meta WHERE key = 'version';") == std::string("2"));
  assert(executor.TableExists("users"));
  assert(executor.TableExists("codes"));
  assert(executor.TableExists("cookies"));
  assert(executor.TableExists("history"));

  // second run is a no-op
  assert(EnsureSchema(executor) == kSchemaVersionCurrent);
  assert(db->QueryText("SELECT COUNT(*) FROM meta;") == std::string("1"));
}

void TestV1StoreIsMigratedPreservingRows() {
  auto db = OpenMemory();
  db->Exec(codestaff::db::sql::kCreateV1);
  db->Exec("INSERT INTO users VALUES (7, 2147483647);");
  db->Exec("INSERT INTO codes VALUES ('ABCDE12345', 100, 1);");
  db->Exec("INSERT INTO cookies VALUES ('ck-1', 'csrf', 'sess', 1700000000, 7);");
  db->Exec("INSERT INTO history VALUES (1700000001, 'ck-1', 'FIRST', NULL);");
  db->Exec("INSERT INTO history VALUES (1700000002, 'ck-1', 'SECOND', 'rejected');");
  db->Exec("INSERT INTO history VALUES (1700000003, 'ck-2', 'THIRD', NULL);");

  SqliteMigrationExecutor executor(db);
  assert(EnsureSchema(executor) == 2);
  assert(db->QueryText("SELECT value FROM meta WHERE key = 'version';") == std::string("2"));

  assert(db->QueryText("SELECT authorized FROM users WHERE id = 7;") == std::string("2147483647"));
  assert(db->QueryText("SELECT message_ref FROM codes WHERE code = 'ABCDE12345';") == std::string("100"));
  assert(db->QueryText("SELECT enabled FROM cookies WHERE id = 'ck-1';") == std::string("1"));
  assert(db->QueryText("SELECT COUNT(*) FROM history;") == std::string("3"));
  assert(db->QueryText("SELECT code FROM history ORDER BY entry_id LIMIT 1;") == std::string("FIRST"));
  assert(db->QueryText("SELECT error FROM history WHERE code = 'SECOND';") == std::string("rejected"));

  SqliteRepository repo(db);
  auto             tx   = repo.Begin();
  auto             rows = repo.ListHistory(*tx, std::string("ck-1"));
  tx->Commit();
  assert(rows.size() == 2);
  assert(rows[0].code == "SECOND");
  assert(rows[1].code == "FIRST");
  assert(!rows[1].error.has_value());
}

void TestFailedStepLeavesV1StoreUntouched() {
  auto db = OpenMemory();
  db->Exec(codestaff::db::sql::kCreateV1);
  db->Exec("INSERT INTO history VALUES (1700000001, 'ck-1', 'FIRST', NULL);");
  // the step's ALTER TABLE collides with this column
  db->Exec("ALTER TABLE cookies ADD COLUMN enabled INTEGER NOT NULL DEFAULT 1;");

  assert(EnsureThrows(db));

  SqliteMigrationExecutor executor(db);
  assert(db->QueryText("SELECT value FROM meta WHERE key = 'version';") == std::string("1"));
  assert(!executor.TableExists("history_v2"));
  assert(db->QueryText("SELECT COUNT(*) FROM history;") == std::string("1"));
  assert(db->QueryText("SELECT COUNT(*) FROM pragma_table_info('history') WHERE name = 'entry_id';") ==
         std::string("0"));

  // once the collision is repaired the same step runs to completion
  db->Exec("ALTER TABLE cookies DROP COLUMN enabled;");
  assert(EnsureSchema(executor) == 2);
  assert(db->QueryText("SELECT value FROM meta WHERE key = 'version';") == std::string("2"));
  assert(db->QueryText("SELECT COUNT(*) FROM history;") == std::string("1"));
  assert(db->QueryText("SELECT code FROM history WHERE entry_id = 1;") == std::string("FIRST"));
}

void TestNewerVersionIsRejected() {
  auto db = OpenMemory();
  db->Exec(codestaff::db::sql::kCreateV2);
  db->Exec("UPDATE meta SET value = '99' WHERE key = 'version';");
  assert(EnsureThrows(db));
}

void TestUnrecognizedVersionIsRejected() {
  auto db = OpenMemory();
  db->Exec(codestaff::db::sql::kCreateV2);
  db->Exec("UPDATE meta SET value = 'v2-beta' WHERE key = 'version';");
  assert(EnsureThrows(db));
}

void TestMissingVersionIsRejected() {
  auto db = OpenMemory();
  db->Exec("CREATE TABLE meta (key TEXT NOT NULL PRIMARY KEY, value TEXT);");
  assert(EnsureThrows(db));
}

void TestParseSchemaVersion() {
  assert(ParseSchemaVersion("1") == 1);
  assert(ParseSchemaVersion("12") == 12);
  assert(!ParseSchemaVersion(""));
  assert(!ParseSchemaVersion("0"));
  assert(!ParseSchemaVersion("-1"));
  assert(!ParseSchemaVersion("2.0"));
  assert(!ParseSchemaVersion(" 2"));
}

} // namespace

int main() {
  TestFreshStoreGetsCurrentSchema();
  TestV1StoreIsMigratedPreservingRows();
  TestFailedStepLeavesV1StoreUntouched();
  TestNewerVersionIsRejected();
  TestUnrecognizedVersionIsRejected();
  TestMissingVersionIsRejected();
  TestParseSchemaVersion();

  std::cout << "codestaff_unit_schema_migration: pass\n";
  return 0;
}
