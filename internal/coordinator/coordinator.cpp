#include "internal/coordinator/coordinator.hpp"

#include <stdexcept>
#include <string>

#include "internal/bus/notification_bus.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace codestaff::coordinator {

namespace obs = codestaff::observability;

using codestaff::db::ErrorCode;
using codestaff::util::StoreError;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  throw StoreError(prefix + ": " + db::ToString(result.code) + " " + result.message);
}

} // namespace

const char* ToString(CookieWrite outcome) {
  switch (outcome) {
    case CookieWrite::Inserted:
      return "inserted";
    case CookieWrite::Updated:
      return "updated";
    case CookieWrite::NotOwner:
      return "not_owner";
    case CookieWrite::CapacityExceeded:
      return "capacity_exceeded";
  }
  return "unknown";
}

const char* ToString(CoordinatorState state) {
  switch (state) {
    case CoordinatorState::Running:
      return "running";
    case CoordinatorState::Draining:
      return "draining";
    case CoordinatorState::Closed:
      return "closed";
  }
  return "unknown";
}

Coordinator::Coordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<bus::NotificationBus> bus,
                         CoordinatorOptions options)
    : repository_(std::move(repository)),
      bus_(std::move(bus)),
      queue_(std::make_shared<RequestQueue>(options.queue_capacity)),
      cookie_ceiling_(options.cookie_ceiling),
      exempt_owners_(options.exempt_owners.begin(), options.exempt_owners.end()) {
}

Coordinator::~Coordinator() {
  queue_->Close();
  if (thread_.joinable()) thread_.join();
}

void Coordinator::Start() {
  if (thread_.joinable()) throw std::logic_error("coordinator already started");
  thread_ = std::thread(&Coordinator::Run, this);
}

void Coordinator::Wait() {
  if (thread_.joinable()) thread_.join();
  if (failure_) std::rethrow_exception(failure_);
}

// ------------------------------------------------------------
// Loop
// ------------------------------------------------------------

void Coordinator::Run() {
  CODESTAFF_LOG_INFO("coordinator started", {obs::IntField("queue_capacity", static_cast<int64_t>(queue_->Capacity()))});

  try {
    while (state_ == CoordinatorState::Running) {
      auto request = queue_->Dequeue();
      if (!request) break;

      std::visit([this](auto& req) { Handle(req); }, *request);
    }
  } catch (const std::exception& e) {
    CODESTAFF_LOG_ERROR("coordinator aborted by store failure", {obs::StringField("error", e.what())});
    Abort(std::current_exception(), "store failure");
    return;
  }

  Shutdown();
}

void Coordinator::Shutdown() {
  queue_->Close();
  if (auto dropped = queue_->DiscardPending(); dropped > 0) {
    CODESTAFF_LOG_WARN("dropped requests queued after terminate", {obs::IntField("count", static_cast<int64_t>(dropped))});
  }

  Announce(bus::Exit{});

  try {
    repository_->Close();
  } catch (const std::exception& e) {
    CODESTAFF_LOG_ERROR("coordinator failed to close store", {obs::StringField("error", e.what())});
    failure_ = std::current_exception();
  }

  bus_->Close();
  state_ = CoordinatorState::Closed;
  CODESTAFF_LOG_INFO("coordinator closed");
}

void Coordinator::Abort(std::exception_ptr failure, const char* reason) {
  failure_ = std::move(failure);

  queue_->Close();
  queue_->DiscardPending();

  try {
    repository_->Close();
  } catch (const std::exception& e) {
    CODESTAFF_LOG_ERROR("store close after failure also failed", {obs::StringField("reason", reason), obs::StringField("error", e.what())});
  }

  bus_->Close();
  state_ = CoordinatorState::Closed;
}

void Coordinator::Announce(bus::BusEvent event) {
  const char* name = bus::EventName(event);
  if (!bus_->Publish(std::move(event))) {
    CODESTAFF_LOG_DEBUG("event dropped, no subscribers", {obs::StringField("event", name)});
  }
}

// ------------------------------------------------------------
// Users
// ------------------------------------------------------------

void Coordinator::Handle(AddUserRequest& req) {
  auto tx = repository_->Begin();

  const bool added = !repository_->FindUser(*tx, req.user).has_value();
  if (added) {
    ThrowIfDbError(repository_->InsertUser(*tx, req.user, ToValue(AccessLevel::kNone)), "insert user");
  }
  tx->Commit();

  if (added) CODESTAFF_LOG_INFO("added user", {obs::IntField("user", req.user)});
  req.reply.set_value(added);
}

void Coordinator::SetLevel(int64_t user, int32_t level) {
  auto tx = repository_->Begin();

  if (repository_->FindUser(*tx, user)) {
    ThrowIfDbError(repository_->SetUserLevel(*tx, user, level), "set user level");
  } else {
    ThrowIfDbError(repository_->InsertUser(*tx, user, level), "insert user");
  }
  tx->Commit();
}

void Coordinator::Handle(ApproveUserRequest& req) {
  // exactly the requested level, never merged with the previous one
  SetLevel(req.user, ToValue(req.level));
  CODESTAFF_LOG_INFO("approved user", {obs::IntField("user", req.user), obs::StringField("level", AccessLevelName(ToValue(req.level)))});
  req.reply.set_value();
}

void Coordinator::Handle(RevokeUserRequest& req) {
  SetLevel(req.user, ToValue(AccessLevel::kNone));
  CODESTAFF_LOG_INFO("revoked user", {obs::IntField("user", req.user)});
  req.reply.set_value();
}

void Coordinator::Handle(QueryUserRequest& req) {
  auto tx   = repository_->Begin();
  auto user = repository_->FindUser(*tx, req.user);
  tx->Commit();
  req.reply.set_value(std::move(user));
}

// ------------------------------------------------------------
// Codes
// ------------------------------------------------------------

void Coordinator::Handle(AddCodeRequest& req) {
  auto tx = repository_->Begin();

  if (repository_->FindCode(*tx, req.code)) {
    tx->Commit();
    req.reply.set_value(false);
    return;
  }

  ThrowIfDbError(repository_->InsertCode(*tx, req.code, req.message_ref), "insert code");
  tx->Commit();

  Announce(bus::NewCode{req.code});
  req.reply.set_value(true);
}

void Coordinator::Handle(QueryCodeRequest& req) {
  auto tx   = repository_->Begin();
  auto code = repository_->FindCode(*tx, req.code);
  tx->Commit();
  req.reply.set_value(std::move(code));
}

void Coordinator::Handle(FinalizeCodeRequest& req) {
  auto tx = repository_->Begin();

  auto result = repository_->MarkFinalized(*tx, req.code);
  if (result.code == ErrorCode::NotFound) {
    tx->Commit();
    req.reply.set_value(std::nullopt);
    return;
  }
  ThrowIfDbError(result, "finalize code");

  auto code = repository_->FindCode(*tx, req.code);
  tx->Commit();
  req.reply.set_value(std::move(code));
}

void Coordinator::Handle(ResendCodeRequest& req) {
  auto tx     = repository_->Begin();
  bool exists = repository_->FindCode(*tx, req.code).has_value();
  tx->Commit();

  if (exists) Announce(bus::NewCode{req.code});
  req.reply.set_value(exists);
}

// ------------------------------------------------------------
// Cookies
// ------------------------------------------------------------

bool Coordinator::CapacityAllows(db::Transaction& tx, const std::string& id, int64_t owner, uint32_t ceiling) {
  // an existing id is a pure update and consumes no new slot
  if (repository_->FindCookie(tx, id)) return true;
  return repository_->CountCookiesByOwner(tx, owner) + 1 <= ceiling;
}

void Coordinator::Handle(SetCookieRequest& req) {
  auto tx = repository_->Begin();

  const bool exempt = exempt_owners_.count(req.owner) > 0;
  if (!exempt && !CapacityAllows(*tx, req.id, req.owner, cookie_ceiling_)) {
    tx->Commit();
    CODESTAFF_LOG_INFO("cookie refused, capacity exceeded", {obs::IntField("owner", req.owner), obs::StringField("id", req.id)});
    req.reply.set_value(CookieWrite::CapacityExceeded);
    return;
  }

  db::UpsertOutcome outcome = db::UpsertOutcome::OwnerMismatch;
  ThrowIfDbError(repository_->UpsertCookie(*tx, req.owner, req.id, req.csrf, req.session, &outcome), "upsert cookie");
  tx->Commit();

  switch (outcome) {
    case db::UpsertOutcome::Inserted:
      req.reply.set_value(CookieWrite::Inserted);
      break;
    case db::UpsertOutcome::Updated:
      req.reply.set_value(CookieWrite::Updated);
      break;
    case db::UpsertOutcome::OwnerMismatch:
      CODESTAFF_LOG_WARN("cookie refused, owned by another user", {obs::IntField("owner", req.owner), obs::StringField("id", req.id)});
      req.reply.set_value(CookieWrite::NotOwner);
      break;
  }
}

void Coordinator::Handle(ToggleCookieRequest& req) {
  auto tx     = repository_->Begin();
  auto result = repository_->SetCookieEnabled(*tx, req.id, req.enabled);
  if (result.code != ErrorCode::NotFound) ThrowIfDbError(result, "toggle cookie");
  tx->Commit();
  req.reply.set_value(static_cast<bool>(result));
}

void Coordinator::Handle(CheckCookieCapacityRequest& req) {
  auto tx      = repository_->Begin();
  bool allowed = CapacityAllows(*tx, req.id, req.owner, req.ceiling);
  tx->Commit();
  req.reply.set_value(allowed);
}

void Coordinator::Handle(QueryCookieRequest& req) {
  auto tx     = repository_->Begin();
  auto cookie = repository_->FindCookie(*tx, req.id);
  tx->Commit();
  req.reply.set_value(std::move(cookie));
}

void Coordinator::Handle(QueryCookiesByOwnerRequest& req) {
  auto tx      = repository_->Begin();
  auto cookies = repository_->ListCookiesByOwner(*tx, req.owner);
  tx->Commit();
  req.reply.set_value(std::move(cookies));
}

void Coordinator::Handle(QueryAllCookiesRequest& req) {
  auto tx      = repository_->Begin();
  auto cookies = repository_->ListCookies(*tx, req.enabled_only);
  tx->Commit();
  req.reply.set_value(std::move(cookies));
}

void Coordinator::Handle(TouchCookieRequest& req) {
  auto tx     = repository_->Begin();
  auto result = repository_->TouchCookie(*tx, req.id, util::NowUnixSeconds());
  if (result.code != ErrorCode::NotFound) ThrowIfDbError(result, "touch cookie");
  tx->Commit();
  req.reply.set_value(static_cast<bool>(result));
}

// ------------------------------------------------------------
// History
// ------------------------------------------------------------

void Coordinator::Handle(InsertHistoryRequest& req) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->AppendHistory(*tx, req.session_id, req.code, req.error, util::NowUnixSeconds()), "append history");
  tx->Commit();
  req.reply.set_value();
}

void Coordinator::Handle(QueryHistoryRequest& req) {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListHistory(*tx, req.session_id);
  tx->Commit();
  req.reply.set_value(std::move(rows));
}

// ------------------------------------------------------------
// Meta
// ------------------------------------------------------------

void Coordinator::Handle(UpdateVersionStatusRequest& req) {
  db::model::VersionStatusRecord status;
  status.value     = req.value;
  status.last_seen = static_cast<uint64_t>(util::NowUnixSeconds());

  bool changed = false;
  auto tx      = repository_->Begin();
  ThrowIfDbError(repository_->WriteVersionStatus(*tx, status, &changed), "write version status");
  tx->Commit();

  if (changed) CODESTAFF_LOG_INFO("version status changed", {obs::StringField("value", req.value)});
  req.reply.set_value(changed);
}

void Coordinator::Handle(QueryVersionStatusRequest& req) {
  auto tx     = repository_->Begin();
  auto status = repository_->ReadVersionStatus(*tx);
  tx->Commit();
  req.reply.set_value(std::move(status));
}

void Coordinator::Handle(TerminateRequest&) {
  CODESTAFF_LOG_INFO("coordinator draining");
  state_ = CoordinatorState::Draining;
  queue_->Close();
}

} // namespace codestaff::coordinator
