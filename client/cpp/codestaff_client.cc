#include "client/cpp/codestaff_client.h"

#include <future>
#include <stdexcept>
#include <utility>

namespace codestaff::client {

namespace cs = codestaff::coordinator;

CoordinatorClient::CoordinatorClient(std::shared_ptr<cs::RequestQueue> queue) : queue_(std::move(queue)) {
  if (!queue_) throw std::invalid_argument("client requires a request queue");
}

CoordinatorClient CoordinatorClient::WithTimeout(std::chrono::milliseconds timeout) const {
  CoordinatorClient copy = *this;
  copy.timeout_          = timeout;
  return copy;
}

template <typename T, typename Req>
std::optional<T> CoordinatorClient::Call(Req request) const {
  auto future = request.reply.get_future();
  if (!queue_->Enqueue(std::move(request))) {
    return std::nullopt;
  }

  if (timeout_ && future.wait_for(*timeout_) != std::future_status::ready) {
    return std::nullopt;
  }

  try {
    return std::optional<T>(std::in_place, future.get());
  } catch (const std::future_error&) {
    // broken promise: the request was dropped without an answer
    return std::nullopt;
  }
}

template <typename Req>
std::optional<bool> CoordinatorClient::CallVoid(Req request) const {
  auto future = request.reply.get_future();
  if (!queue_->Enqueue(std::move(request))) {
    return std::nullopt;
  }

  if (timeout_ && future.wait_for(*timeout_) != std::future_status::ready) {
    return std::nullopt;
  }

  try {
    future.get();
    return true;
  } catch (const std::future_error&) {
    return std::nullopt;
  }
}

// ------------------------------------------------------------
// Users
// ------------------------------------------------------------

std::optional<bool> CoordinatorClient::AddUser(int64_t user) const {
  cs::AddUserRequest req;
  req.user = user;
  return Call<bool>(std::move(req));
}

std::optional<bool> CoordinatorClient::ApproveUser(int64_t user, AccessLevel level) const {
  cs::ApproveUserRequest req;
  req.user  = user;
  req.level = level;
  return CallVoid(std::move(req));
}

std::optional<bool> CoordinatorClient::RevokeUser(int64_t user) const {
  cs::RevokeUserRequest req;
  req.user = user;
  return CallVoid(std::move(req));
}

std::optional<std::optional<db::model::UserRecord>> CoordinatorClient::QueryUser(int64_t user) const {
  cs::QueryUserRequest req;
  req.user = user;
  return Call<std::optional<db::model::UserRecord>>(std::move(req));
}

std::optional<bool> CoordinatorClient::CheckAccess(int64_t user, AccessLevel requested) const {
  auto found = QueryUser(user);
  if (!found) return std::nullopt;
  if (!*found) return false;
  return cs::IsAuthorized(requested, (*found)->authorized);
}

// ------------------------------------------------------------
// Codes
// ------------------------------------------------------------

std::optional<bool> CoordinatorClient::AddCode(const std::string& code, int32_t message_ref) const {
  cs::AddCodeRequest req;
  req.code        = code;
  req.message_ref = message_ref;
  return Call<bool>(std::move(req));
}

std::optional<std::optional<db::model::CodeRecord>> CoordinatorClient::QueryCode(const std::string& code) const {
  cs::QueryCodeRequest req;
  req.code = code;
  return Call<std::optional<db::model::CodeRecord>>(std::move(req));
}

std::optional<std::optional<db::model::CodeRecord>> CoordinatorClient::FinalizeCode(const std::string& code) const {
  cs::FinalizeCodeRequest req;
  req.code = code;
  return Call<std::optional<db::model::CodeRecord>>(std::move(req));
}

std::optional<bool> CoordinatorClient::ResendCode(const std::string& code) const {
  cs::ResendCodeRequest req;
  req.code = code;
  return Call<bool>(std::move(req));
}

// ------------------------------------------------------------
// Cookies
// ------------------------------------------------------------

std::optional<CoordinatorClient::CookieWrite> CoordinatorClient::SetCookie(int64_t owner, const std::string& id,
                                                                           const std::string& csrf,
                                                                           const std::string& session) const {
  cs::SetCookieRequest req;
  req.owner   = owner;
  req.id      = id;
  req.csrf    = csrf;
  req.session = session;
  return Call<CookieWrite>(std::move(req));
}

std::optional<bool> CoordinatorClient::ToggleCookie(const std::string& id, bool enabled) const {
  cs::ToggleCookieRequest req;
  req.id      = id;
  req.enabled = enabled;
  return Call<bool>(std::move(req));
}

std::optional<bool> CoordinatorClient::CheckCookieCapacity(const std::string& id, int64_t owner, uint32_t ceiling) const {
  cs::CheckCookieCapacityRequest req;
  req.id      = id;
  req.owner   = owner;
  req.ceiling = ceiling;
  return Call<bool>(std::move(req));
}

std::optional<std::optional<db::model::CookieRecord>> CoordinatorClient::QueryCookie(const std::string& id) const {
  cs::QueryCookieRequest req;
  req.id = id;
  return Call<std::optional<db::model::CookieRecord>>(std::move(req));
}

std::optional<std::vector<db::model::CookieRecord>> CoordinatorClient::QueryCookiesByOwner(int64_t owner) const {
  cs::QueryCookiesByOwnerRequest req;
  req.owner = owner;
  return Call<std::vector<db::model::CookieRecord>>(std::move(req));
}

std::optional<std::vector<db::model::CookieRecord>> CoordinatorClient::QueryAllCookies(bool enabled_only) const {
  cs::QueryAllCookiesRequest req;
  req.enabled_only = enabled_only;
  return Call<std::vector<db::model::CookieRecord>>(std::move(req));
}

std::optional<bool> CoordinatorClient::TouchCookie(const std::string& id) const {
  cs::TouchCookieRequest req;
  req.id = id;
  return Call<bool>(std::move(req));
}

// ------------------------------------------------------------
// History
// ------------------------------------------------------------

std::optional<bool> CoordinatorClient::InsertHistory(const std::string& session_id, const std::string& code,
                                                     const std::optional<std::string>& error) const {
  cs::InsertHistoryRequest req;
  req.session_id = session_id;
  req.code       = code;
  req.error      = error;
  return CallVoid(std::move(req));
}

std::optional<std::vector<db::model::HistoryRecord>> CoordinatorClient::QueryHistory(
    const std::optional<std::string>& session_id) const {
  cs::QueryHistoryRequest req;
  req.session_id = session_id;
  return Call<std::vector<db::model::HistoryRecord>>(std::move(req));
}

// ------------------------------------------------------------
// Meta
// ------------------------------------------------------------

std::optional<bool> CoordinatorClient::UpdateVersionStatus(const std::string& value) const {
  cs::UpdateVersionStatusRequest req;
  req.value = value;
  return Call<bool>(std::move(req));
}

std::optional<std::optional<db::model::VersionStatusRecord>> CoordinatorClient::QueryVersionStatus() const {
  return Call<std::optional<db::model::VersionStatusRecord>>(cs::QueryVersionStatusRequest{});
}

bool CoordinatorClient::Terminate() const {
  return queue_->Enqueue(cs::TerminateRequest{});
}

} // namespace codestaff::client
