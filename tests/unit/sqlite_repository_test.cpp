#include "internal/db/sqlite/sqlite_repository.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/util/errors.hpp"

namespace {

using codestaff::db::ErrorCode;
using codestaff::db::kHistoryLimitAll;
using codestaff::db::kHistoryLimitSession;
using codestaff::db::UpsertOutcome;
using codestaff::db::model::VersionStatusRecord;
using codestaff::db::sqlite::SqliteDB;
using codestaff::db::sqlite::SqliteMigrationExecutor;
using codestaff::db::sqlite::SqliteRepository;

struct Fixture {
  std::shared_ptr<SqliteDB>         db;
  std::shared_ptr<SqliteRepository> repo;
};

Fixture MakeFixture() {
  Fixture f;
  f.db = std::make_shared<SqliteDB>(":memory:");
  SqliteMigrationExecutor executor(f.db);
  (void)codestaff::db::sql::EnsureSchema(executor);
  f.repo = std::make_shared<SqliteRepository>(f.db);
  return f;
}

void TestUserInsertAndLevelChange() {
  auto f  = MakeFixture();
  auto tx = f.repo->Begin();

  assert(!f.repo->FindUser(*tx, 42));
  assert(f.repo->InsertUser(*tx, 42, 0));
  assert(f.repo->InsertUser(*tx, 42, 0).code == ErrorCode::ConstraintViolation);

  assert(f.repo->SetUserLevel(*tx, 42, 2));
  assert(f.repo->FindUser(*tx, 42)->authorized == 2);
  assert(f.repo->SetUserLevel(*tx, 43, 2).code == ErrorCode::NotFound);
  tx->Commit();
}

void TestUncommittedTransactionRollsBack() {
  auto f = MakeFixture();
  {
    auto tx = f.repo->Begin();
    assert(f.repo->InsertCode(*tx, "LOST", 1));
  }

  auto tx = f.repo->Begin();
  assert(!f.repo->FindCode(*tx, "LOST"));
  tx->Commit();
}

void TestCodeFinalizeIsNotFoundForUnknownCode() {
  auto f  = MakeFixture();
  auto tx = f.repo->Begin();

  assert(f.repo->InsertCode(*tx, "ABCDE12345", 100));
  assert(f.repo->MarkFinalized(*tx, "ABCDE12345"));
  assert(f.repo->MarkFinalized(*tx, "ABCDE12345"));
  assert(f.repo->FindCode(*tx, "ABCDE12345")->finalized);
  assert(f.repo->MarkFinalized(*tx, "NOPE").code == ErrorCode::NotFound);
  tx->Commit();
}

void TestCookieUpsertKeepsOwner() {
  auto f  = MakeFixture();
  auto tx = f.repo->Begin();

  UpsertOutcome outcome = UpsertOutcome::OwnerMismatch;
  assert(f.repo->UpsertCookie(*tx, 1, "ck", "csrf-a", "sess-a", &outcome));
  assert(outcome == UpsertOutcome::Inserted);

  assert(f.repo->UpsertCookie(*tx, 1, "ck", "csrf-b", "sess-b", &outcome));
  assert(outcome == UpsertOutcome::Updated);

  assert(f.repo->UpsertCookie(*tx, 2, "ck", "csrf-x", "sess-x", &outcome));
  assert(outcome == UpsertOutcome::OwnerMismatch);

  auto cookie = f.repo->FindCookie(*tx, "ck");
  assert(cookie);
  assert(cookie->belong == 1);
  assert(cookie->csrf_token == "csrf-b");
  assert(cookie->session_id == "sess-b");
  assert(cookie->enabled);
  assert(f.repo->CountCookiesByOwner(*tx, 1) == 1);
  assert(f.repo->CountCookiesByOwner(*tx, 2) == 0);

  assert(f.repo->SetCookieEnabled(*tx, "ck", false));
  assert(f.repo->ListCookies(*tx, true).empty());
  assert(f.repo->ListCookies(*tx, false).size() == 1);
  assert(f.repo->SetCookieEnabled(*tx, "missing", true).code == ErrorCode::NotFound);

  assert(f.repo->TouchCookie(*tx, "ck", 1700000000));
  assert(f.repo->FindCookie(*tx, "ck")->last_login == 1700000000);
  assert(f.repo->TouchCookie(*tx, "missing", 1).code == ErrorCode::NotFound);
  tx->Commit();
}

void TestHistoryIsNewestFirstAndBounded() {
  auto f  = MakeFixture();
  auto tx = f.repo->Begin();

  for (int i = 0; i < 50; ++i) {
    const std::string session = (i % 2 == 0) ? "even" : "odd";
    assert(f.repo->AppendHistory(*tx, session, "CODE" + std::to_string(i), std::nullopt, 1000 + i));
  }
  assert(f.repo->AppendHistory(*tx, "odd", "BAD", std::string("rejected"), 2000));

  auto all = f.repo->ListHistory(*tx, std::nullopt);
  assert(all.size() == static_cast<size_t>(kHistoryLimitAll));
  assert(all.front().code == "BAD");
  assert(all.front().error == std::string("rejected"));
  assert(all[1].code == "CODE49");

  auto even = f.repo->ListHistory(*tx, std::string("even"));
  assert(even.size() == static_cast<size_t>(kHistoryLimitSession));
  assert(even.front().code == "CODE48");
  for (const auto& row : even) assert(row.session_id == "even");

  assert(f.repo->ListHistory(*tx, std::string("nobody")).empty());
  tx->Commit();
}

void TestVersionStatusWrittenOnlyOnChange() {
  auto f  = MakeFixture();
  auto tx = f.repo->Begin();

  assert(!f.repo->ReadVersionStatus(*tx));

  bool changed = false;
  assert(f.repo->WriteVersionStatus(*tx, VersionStatusRecord{"1.4.2", 100}, &changed));
  assert(changed);

  assert(f.repo->WriteVersionStatus(*tx, VersionStatusRecord{"1.4.2", 200}, &changed));
  assert(!changed);
  auto status = f.repo->ReadVersionStatus(*tx);
  assert(status->value == "1.4.2");
  assert(status->last_seen == 100);

  assert(f.repo->WriteVersionStatus(*tx, VersionStatusRecord{"1.5.0", 300}, &changed));
  assert(changed);
  assert(f.repo->ReadVersionStatus(*tx)->last_seen == 300);
  tx->Commit();
}

void TestVersionStatusAcceptsNumericLast() {
  auto f = MakeFixture();
  f.db->Exec(R"(INSERT INTO meta VALUES ('intel_v', '{"v":"2.0","last":1700000000}');)");

  auto tx     = f.repo->Begin();
  auto status = f.repo->ReadVersionStatus(*tx);
  tx->Commit();
  assert(status->value == "2.0");
  assert(status->last_seen == 1700000000u);
}

void TestVersionStatusStoresNumericLast() {
  auto f  = MakeFixture();
  auto tx = f.repo->Begin();

  bool changed = false;
  assert(f.repo->WriteVersionStatus(*tx, VersionStatusRecord{"2.1", 1700000000}, &changed));
  tx->Commit();

  auto blob = f.db->QueryText("SELECT value FROM meta WHERE key = 'intel_v';");
  assert(blob);
  assert(blob->find(R"("last":1700000000)") != std::string::npos);
  assert(blob->find(R"("v":"2.1")") != std::string::npos);
}

void TestCorruptVersionStatusIsStoreError() {
  auto f = MakeFixture();
  f.db->Exec("INSERT INTO meta VALUES ('intel_v', 'not json');");

  auto tx    = f.repo->Begin();
  bool threw = false;
  try {
    (void)f.repo->ReadVersionStatus(*tx);
  } catch (const codestaff::util::StoreError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestUserInsertAndLevelChange();
  TestUncommittedTransactionRollsBack();
  TestCodeFinalizeIsNotFoundForUnknownCode();
  TestCookieUpsertKeepsOwner();
  TestHistoryIsNewestFirstAndBounded();
  TestVersionStatusWrittenOnlyOnChange();
  TestVersionStatusAcceptsNumericLast();
  TestVersionStatusStoresNumericLast();
  TestCorruptVersionStatusIsStoreError();

  std::cout << "codestaff_unit_sqlite_repository: pass\n";
  return 0;
}
