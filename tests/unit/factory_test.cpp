#include "internal/factory.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/util/errors.hpp"

namespace {

using codestaff::factory::Build;
using codestaff::runtime::config::RuntimeConfig;

std::filesystem::path FreshPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "codestaff_factory_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path;
}

RuntimeConfig ConfigFor(const std::filesystem::path& path) {
  RuntimeConfig config;
  config.mutable_database()->set_path(path.string());
  return config;
}

void TestStatePersistsAcrossRestart() {
  const auto path = FreshPath("restart");

  {
    auto app = Build(ConfigFor(path));
    assert(app.client->AddCode("ABCDE12345", 100) == true);
    assert(app.client->ApproveUser(42, codestaff::coordinator::AccessLevel::kSend) == true);
    assert(app.client->Terminate());
    app.coordinator->Wait();
  }

  auto app  = Build(ConfigFor(path));
  auto code = app.client->QueryCode("ABCDE12345");
  assert(code && *code && (*code)->message_ref == 100);
  assert(app.client->CheckAccess(42, codestaff::coordinator::AccessLevel::kNone) == true);
  assert(app.client->Terminate());
  app.coordinator->Wait();
}

void TestV1StoreIsUpgradedAtStartup() {
  const auto path = FreshPath("upgrade");
  {
    codestaff::db::sqlite::SqliteDB db(path.string());
    db.Exec(codestaff::db::sql::kCreateV1);
    db.Exec("INSERT INTO history VALUES (1700000000, 'ck', 'OLDCODE', NULL);");
    db.Close();
  }

  auto app  = Build(ConfigFor(path));
  auto rows = app.client->QueryHistory();
  assert(rows && rows->size() == 1);
  assert(rows->front().code == "OLDCODE");
  assert(rows->front().entry_id == 1);
  assert(app.client->Terminate());
  app.coordinator->Wait();
}

void TestUnreachableStoreIsSchemaError() {
  RuntimeConfig config;
  config.mutable_database()->set_path("/nonexistent-codestaff-dir/sub/state.db");

  bool threw = false;
  try {
    (void)Build(config);
  } catch (const codestaff::util::SchemaError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestStatePersistsAcrossRestart();
  TestV1StoreIsUpgradedAtStartup();
  TestUnreachableStoreIsSchemaError();

  std::cout << "codestaff_unit_factory: pass\n";
  return 0;
}
