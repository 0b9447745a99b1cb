#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <thread>
#include <unordered_set>
#include <vector>

#include "internal/bus/notification_bus.hpp"
#include "internal/coordinator/request.hpp"
#include "internal/coordinator/request_queue.hpp"

namespace codestaff::db {
class Repository;
class Transaction;
}

namespace codestaff::coordinator {

struct CoordinatorOptions {
  std::size_t queue_capacity = 2048;

  // cookies one owner may hold; checked only when a new cookie is created
  uint32_t cookie_ceiling = 2;

  // owners not subject to cookie_ceiling
  std::vector<int64_t> exempt_owners;
};

enum class CoordinatorState {
  Running,
  Draining,
  Closed,
};

const char* ToString(CoordinatorState state);

/*
  Single writer.

  Owns the repository and the publish side of the bus. A dedicated thread
  drains the request queue and runs each request to completion (store
  calls, commit, publish, reply) before taking the next one, so checks
  and the writes that depend on them never interleave.

  Any store failure ends the loop: the store is closed, the bus is closed,
  and Wait() rethrows the failure. Nothing is retried.
*/
class Coordinator {
 public:
  Coordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<bus::NotificationBus> bus,
              CoordinatorOptions options);
  ~Coordinator();

  Coordinator(const Coordinator&)            = delete;
  Coordinator& operator=(const Coordinator&) = delete;

  void Start();

  // Joins the loop; rethrows the failure that aborted it, if any.
  void Wait();

  std::shared_ptr<RequestQueue> Queue() const {
    return queue_;
  }

  CoordinatorState State() const {
    return state_.load();
  }

 private:
  void Run();
  void Shutdown();
  void Abort(std::exception_ptr failure, const char* reason);
  void Announce(bus::BusEvent event);

  void Handle(AddUserRequest& req);
  void Handle(ApproveUserRequest& req);
  void Handle(RevokeUserRequest& req);
  void Handle(QueryUserRequest& req);
  void Handle(AddCodeRequest& req);
  void Handle(QueryCodeRequest& req);
  void Handle(FinalizeCodeRequest& req);
  void Handle(ResendCodeRequest& req);
  void Handle(SetCookieRequest& req);
  void Handle(ToggleCookieRequest& req);
  void Handle(CheckCookieCapacityRequest& req);
  void Handle(QueryCookieRequest& req);
  void Handle(QueryCookiesByOwnerRequest& req);
  void Handle(QueryAllCookiesRequest& req);
  void Handle(TouchCookieRequest& req);
  void Handle(InsertHistoryRequest& req);
  void Handle(QueryHistoryRequest& req);
  void Handle(UpdateVersionStatusRequest& req);
  void Handle(QueryVersionStatusRequest& req);
  void Handle(TerminateRequest& req);

  void SetLevel(int64_t user, int32_t level);
  bool CapacityAllows(db::Transaction& tx, const std::string& id, int64_t owner, uint32_t ceiling);

  std::shared_ptr<db::Repository>      repository_;
  std::shared_ptr<bus::NotificationBus> bus_;
  std::shared_ptr<RequestQueue>         queue_;

  uint32_t                    cookie_ceiling_;
  std::unordered_set<int64_t> exempt_owners_;

  std::thread                   thread_;
  std::atomic<CoordinatorState> state_{CoordinatorState::Running};
  std::exception_ptr            failure_;
};

} // namespace codestaff::coordinator
