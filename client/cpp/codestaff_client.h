#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/coordinator/access_level.hpp"
#include "internal/coordinator/request.hpp"
#include "internal/coordinator/request_queue.hpp"

namespace codestaff::client {

/*
  Caller-side handle to a running Coordinator.

  Copies share the inbound queue and nothing else. Every call blocks until
  the coordinator answers; std::nullopt means the operation was not
  performed (coordinator terminated, request dropped, or timed out).
*/
class CoordinatorClient {
 public:
  using AccessLevel = codestaff::coordinator::AccessLevel;
  using CookieWrite = codestaff::coordinator::CookieWrite;

  explicit CoordinatorClient(std::shared_ptr<codestaff::coordinator::RequestQueue> queue);

  // Copy that gives up waiting after `timeout`. A timed-out request may
  // still be executed later.
  CoordinatorClient WithTimeout(std::chrono::milliseconds timeout) const;

  // users
  std::optional<bool> AddUser(int64_t user) const;
  std::optional<bool> ApproveUser(int64_t user, AccessLevel level) const;
  std::optional<bool> RevokeUser(int64_t user) const;
  std::optional<std::optional<db::model::UserRecord>> QueryUser(int64_t user) const;

  // Queries the user and applies the authorization test; an unknown user is denied.
  std::optional<bool> CheckAccess(int64_t user, AccessLevel requested) const;

  // codes
  std::optional<bool> AddCode(const std::string& code, int32_t message_ref) const;
  std::optional<std::optional<db::model::CodeRecord>> QueryCode(const std::string& code) const;
  std::optional<std::optional<db::model::CodeRecord>> FinalizeCode(const std::string& code) const;
  std::optional<bool> ResendCode(const std::string& code) const;

  // cookies
  std::optional<CookieWrite> SetCookie(int64_t owner, const std::string& id, const std::string& csrf,
                                       const std::string& session) const;
  std::optional<bool> ToggleCookie(const std::string& id, bool enabled) const;
  std::optional<bool> CheckCookieCapacity(const std::string& id, int64_t owner, uint32_t ceiling) const;
  std::optional<std::optional<db::model::CookieRecord>> QueryCookie(const std::string& id) const;
  std::optional<std::vector<db::model::CookieRecord>> QueryCookiesByOwner(int64_t owner) const;
  std::optional<std::vector<db::model::CookieRecord>> QueryAllCookies(bool enabled_only = false) const;
  std::optional<bool> TouchCookie(const std::string& id) const;

  // history
  std::optional<bool> InsertHistory(const std::string& session_id, const std::string& code,
                                    const std::optional<std::string>& error = std::nullopt) const;
  std::optional<std::vector<db::model::HistoryRecord>> QueryHistory(
      const std::optional<std::string>& session_id = std::nullopt) const;

  // meta
  std::optional<bool> UpdateVersionStatus(const std::string& value) const;
  std::optional<std::optional<db::model::VersionStatusRecord>> QueryVersionStatus() const;

  // Returns false when the coordinator already stopped accepting requests.
  bool Terminate() const;

 private:
  template <typename T, typename Req>
  std::optional<T> Call(Req request) const;

  template <typename Req>
  std::optional<bool> CallVoid(Req request) const;

  std::shared_ptr<codestaff::coordinator::RequestQueue> queue_;
  std::optional<std::chrono::milliseconds>              timeout_;
};

} // namespace codestaff::client
