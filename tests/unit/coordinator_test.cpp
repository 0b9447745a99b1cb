#include "internal/coordinator/coordinator.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "client/cpp/codestaff_client.h"
#include "internal/bus/notification_bus.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/util/errors.hpp"

namespace {

using codestaff::bus::Exit;
using codestaff::bus::NewCode;
using codestaff::bus::NotificationBus;
using codestaff::bus::RecvStatus;
using codestaff::client::CoordinatorClient;
using codestaff::coordinator::AccessLevel;
using codestaff::coordinator::Coordinator;
using codestaff::coordinator::CoordinatorOptions;
using codestaff::coordinator::CoordinatorState;
using codestaff::coordinator::CookieWrite;
using codestaff::db::sqlite::SqliteDB;
using codestaff::db::sqlite::SqliteMigrationExecutor;
using codestaff::db::sqlite::SqliteRepository;

constexpr auto kQuiet = std::chrono::milliseconds(50);

struct Harness {
  std::shared_ptr<SqliteDB>          db;
  std::shared_ptr<SqliteRepository>  repo;
  std::shared_ptr<NotificationBus>   bus;
  std::unique_ptr<Coordinator>       coordinator;
  std::unique_ptr<CoordinatorClient> client;
};

Harness Start(CoordinatorOptions options = {}) {
  Harness h;
  h.db = std::make_shared<SqliteDB>(":memory:");
  SqliteMigrationExecutor executor(h.db);
  (void)codestaff::db::sql::EnsureSchema(executor);

  h.repo        = std::make_shared<SqliteRepository>(h.db);
  h.bus         = std::make_shared<NotificationBus>(16);
  h.coordinator = std::make_unique<Coordinator>(h.repo, h.bus, std::move(options));
  h.coordinator->Start();
  h.client = std::make_unique<CoordinatorClient>(h.coordinator->Queue());
  return h;
}

void TestApproveThenRevokeAppliesInOrder() {
  auto  h      = Start();
  auto& client = *h.client;

  assert(client.AddUser(5) == true);
  assert(client.AddUser(5) == false);
  assert(client.CheckAccess(5, AccessLevel::kNone) == false);

  assert(client.ApproveUser(5, AccessLevel::kAll) == true);
  assert(client.RevokeUser(5) == true);

  auto user = client.QueryUser(5);
  assert(user && *user);
  assert((*user)->authorized == 0);

  // approval replaces the level, it does not merge
  assert(client.ApproveUser(5, AccessLevel::kAll) == true);
  assert(client.ApproveUser(5, AccessLevel::kCookie) == true);
  assert((*client.QueryUser(5))->authorized == 2);
  assert(client.CheckAccess(5, AccessLevel::kSend) == true);

  // approving an unknown user creates it
  assert(client.ApproveUser(6, AccessLevel::kSend) == true);
  assert((*client.QueryUser(6))->authorized == 1);

  auto missing = client.QueryUser(404);
  assert(missing && !*missing);
  assert(client.CheckAccess(404, AccessLevel::kSend) == false);
}

// Callers race on one identity. Each request is enqueued under a lock that
// also records it, so the recorded list is the order the coordinator
// serializes them in.
void TestRacingLevelChangesEndAtLastSerializedCall() {
  auto h = Start();

  constexpr int     kThreads = 8;
  constexpr int     kRounds  = 25;
  constexpr int64_t kUser    = 42;

  std::mutex       order_mutex;
  std::vector<int> order; // 0 add, 1 approve all, 2 approve send, 3 revoke

  auto queue = h.coordinator->Queue();

  std::vector<std::thread> callers;
  for (int t = 0; t < kThreads; ++t) {
    callers.emplace_back([&, t] {
      for (int i = 0; i < kRounds; ++i) {
        const int op = (t + i) % 4;

        std::future<void> done;
        std::future<bool> added;
        {
          std::lock_guard lock(order_mutex);
          bool            queued = false;
          if (op == 0) {
            codestaff::coordinator::AddUserRequest req;
            req.user = kUser;
            added    = req.reply.get_future();
            queued   = queue->Enqueue(std::move(req));
          } else if (op == 3) {
            codestaff::coordinator::RevokeUserRequest req;
            req.user = kUser;
            done     = req.reply.get_future();
            queued   = queue->Enqueue(std::move(req));
          } else {
            codestaff::coordinator::ApproveUserRequest req;
            req.user  = kUser;
            req.level = op == 1 ? AccessLevel::kAll : AccessLevel::kSend;
            done      = req.reply.get_future();
            queued    = queue->Enqueue(std::move(req));
          }
          assert(queued);
          order.push_back(op);
        }

        if (op == 0) {
          (void)added.get();
        } else {
          done.get();
        }
      }
    });
  }
  for (auto& caller : callers) caller.join();

  assert(order.size() == static_cast<size_t>(kThreads * kRounds));

  std::optional<int32_t> expected;
  for (int op : order) {
    switch (op) {
      case 0:
        if (!expected) expected = 0;
        break;
      case 1:
        expected = 0x7fffffff;
        break;
      case 2:
        expected = 1;
        break;
      default:
        expected = 0;
        break;
    }
  }

  auto user = h.client->QueryUser(kUser);
  assert(user && *user);
  assert(expected && (*user)->authorized == *expected);
}

void TestCodeLifecycleReachesSubscribers() {
  auto  h      = Start();
  auto& client = *h.client;
  auto  sub    = h.bus->Subscribe();

  assert(client.AddCode("ABCDE12345", 100) == true);

  auto event = sub.Recv();
  assert(event.status == RecvStatus::Event);
  assert(std::get<NewCode>(event.event).code == "ABCDE12345");

  auto code = client.QueryCode("ABCDE12345");
  assert(code && *code);
  assert((*code)->message_ref == 100);
  assert(!(*code)->finalized);

  // duplicate is refused and not announced again
  assert(client.AddCode("ABCDE12345", 101) == false);
  assert(sub.RecvFor(kQuiet).status == RecvStatus::Timeout);

  auto first  = client.FinalizeCode("ABCDE12345");
  auto second = client.FinalizeCode("ABCDE12345");
  assert(first && *first && (*first)->finalized);
  assert(second && *second && (*second)->finalized);
  assert((*second)->message_ref == 100);

  auto unknown = client.FinalizeCode("NOPE");
  assert(unknown && !*unknown);

  assert(client.ResendCode("ABCDE12345") == true);
  assert(std::get<NewCode>(sub.Recv().event).code == "ABCDE12345");
  assert(client.ResendCode("NOPE") == false);
  assert(sub.RecvFor(kQuiet).status == RecvStatus::Timeout);
}

void TestConcurrentCookiesRespectCeiling() {
  CoordinatorOptions options;
  options.cookie_ceiling = 2;
  auto h                 = Start(options);

  std::atomic<int> inserted{0};
  std::atomic<int> refused{0};

  std::vector<std::thread> callers;
  for (int i = 0; i < 3; ++i) {
    CoordinatorClient client = *h.client;
    callers.emplace_back([client, i, &inserted, &refused] {
      auto outcome = client.SetCookie(77, "ck-" + std::to_string(i), "csrf", "sess");
      assert(outcome);
      if (*outcome == CookieWrite::Inserted) ++inserted;
      if (*outcome == CookieWrite::CapacityExceeded) ++refused;
    });
  }
  for (auto& t : callers) t.join();

  assert(inserted == 2);
  assert(refused == 1);

  auto owned = h.client->QueryCookiesByOwner(77);
  assert(owned && owned->size() == 2);

  // refreshing an existing cookie consumes no slot
  const auto& existing = owned->front().id;
  assert(h.client->SetCookie(77, existing, "csrf-2", "sess-2") == CookieWrite::Updated);
  assert(h.client->CheckCookieCapacity(existing, 77, 2) == true);
  assert(h.client->CheckCookieCapacity("ck-new", 77, 2) == false);
  assert(h.client->CheckCookieCapacity("ck-new", 77, 3) == true);
}

void TestForeignOwnerCannotTakeCookie() {
  auto  h      = Start();
  auto& client = *h.client;

  assert(client.SetCookie(1, "shared", "csrf-1", "sess-1") == CookieWrite::Inserted);
  assert(client.SetCookie(2, "shared", "csrf-2", "sess-2") == CookieWrite::NotOwner);

  auto cookie = client.QueryCookie("shared");
  assert(cookie && *cookie);
  assert((*cookie)->belong == 1);
  assert((*cookie)->csrf_token == "csrf-1");
  assert((*cookie)->session_id == "sess-1");
}

void TestExemptOwnerBypassesCeiling() {
  CoordinatorOptions options;
  options.cookie_ceiling = 1;
  options.exempt_owners  = {900};
  auto h                 = Start(options);

  for (int i = 0; i < 3; ++i) {
    assert(h.client->SetCookie(900, "admin-" + std::to_string(i), "c", "s") == CookieWrite::Inserted);
  }
  assert(h.client->SetCookie(901, "user-0", "c", "s") == CookieWrite::Inserted);
  assert(h.client->SetCookie(901, "user-1", "c", "s") == CookieWrite::CapacityExceeded);
}

void TestCookieToggleAndTouch() {
  auto  h      = Start();
  auto& client = *h.client;

  assert(client.SetCookie(3, "ck", "c", "s") == CookieWrite::Inserted);
  assert(client.ToggleCookie("ck", false) == true);
  assert(client.ToggleCookie("missing", false) == false);

  auto enabled = client.QueryAllCookies(true);
  assert(enabled && enabled->empty());
  auto all = client.QueryAllCookies(false);
  assert(all && all->size() == 1 && !all->front().enabled);

  assert(client.TouchCookie("ck") == true);
  assert((*client.QueryCookie("ck"))->last_login > 0);
  assert(client.TouchCookie("missing") == false);
}

void TestHistoryAndVersionStatus() {
  auto  h      = Start();
  auto& client = *h.client;

  assert(client.InsertHistory("ck", "ABCDE12345") == true);
  assert(client.InsertHistory("ck", "ZZZZZ00000", std::string("expired")) == true);
  assert(client.InsertHistory("other", "YYYYY11111") == true);

  auto rows = client.QueryHistory(std::string("ck"));
  assert(rows && rows->size() == 2);
  assert(rows->front().code == "ZZZZZ00000");
  assert(rows->front().error == std::string("expired"));
  assert(client.QueryHistory()->size() == 3);

  auto none = client.QueryVersionStatus();
  assert(none && !*none);
  assert(client.UpdateVersionStatus("1.0.0") == true);
  assert(client.UpdateVersionStatus("1.0.0") == false);
  assert((*client.QueryVersionStatus())->value == "1.0.0");
}

void TestTerminatePublishesExitAndRefusesLaterRequests() {
  auto h   = Start();
  auto sub = h.bus->Subscribe();

  assert(h.client->AddUser(1) == true);
  assert(h.client->Terminate());
  h.coordinator->Wait();
  assert(h.coordinator->State() == CoordinatorState::Closed);

  auto exit = sub.Recv();
  assert(exit.status == RecvStatus::Event);
  assert(std::holds_alternative<Exit>(exit.event));
  assert(sub.Recv().status == RecvStatus::Closed);

  assert(!h.client->AddUser(2));
  assert(!h.client->QueryCode("ABCDE12345"));
  assert(!h.client->Terminate());
}

void TestAbandonedReplyIsHarmless() {
  auto h = Start();

  {
    codestaff::coordinator::AddUserRequest req;
    req.user = 11;
    auto future = req.reply.get_future();
    assert(h.coordinator->Queue()->Enqueue(std::move(req)));
  }

  assert(h.client->AddUser(11) == false);
  assert(h.coordinator->State() == CoordinatorState::Running);
}

void TestStoreFailureStopsCoordinator() {
  auto h   = Start();
  auto sub = h.bus->Subscribe();

  assert(h.client->AddUser(1) == true);
  h.db->Close();

  assert(!h.client->AddUser(2));

  bool rethrown = false;
  try {
    h.coordinator->Wait();
  } catch (const codestaff::util::StoreError&) {
    rethrown = true;
  }
  assert(rethrown);
  assert(h.coordinator->State() == CoordinatorState::Closed);

  // no Exit on the failure path, only close
  assert(sub.Recv().status == RecvStatus::Closed);
  assert(!h.client->AddUser(3));
}

} // namespace

int main() {
  TestApproveThenRevokeAppliesInOrder();
  TestRacingLevelChangesEndAtLastSerializedCall();
  TestCodeLifecycleReachesSubscribers();
  TestConcurrentCookiesRespectCeiling();
  TestForeignOwnerCannotTakeCookie();
  TestExemptOwnerBypassesCeiling();
  TestCookieToggleAndTouch();
  TestHistoryAndVersionStatus();
  TestTerminatePublishesExitAndRefusesLaterRequests();
  TestAbandonedReplyIsHarmless();
  TestStoreFailureStopsCoordinator();

  std::cout << "codestaff_unit_coordinator: pass\n";
  return 0;
}
