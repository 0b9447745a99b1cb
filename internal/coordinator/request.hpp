#pragma once

#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/coordinator/access_level.hpp"
#include "internal/db/model/code_record.hpp"
#include "internal/db/model/cookie_record.hpp"
#include "internal/db/model/history_record.hpp"
#include "internal/db/model/meta_record.hpp"
#include "internal/db/model/user_record.hpp"

namespace codestaff::coordinator {

/*
  Typed requests accepted by the Coordinator.

  Each carries its payload and a single-use reply. The Coordinator fulfils
  the promise exactly once; a promise destroyed unfulfilled means the
  request was dropped.
*/

enum class CookieWrite {
  Inserted,
  Updated,
  NotOwner,
  CapacityExceeded,
};

const char* ToString(CookieWrite outcome);

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

struct AddUserRequest {
  int64_t            user = 0;
  std::promise<bool> reply;  // true when newly added
};

struct ApproveUserRequest {
  int64_t            user  = 0;
  AccessLevel        level = AccessLevel::kNone;
  std::promise<void> reply;
};

struct RevokeUserRequest {
  int64_t            user = 0;
  std::promise<void> reply;
};

struct QueryUserRequest {
  int64_t                                       user = 0;
  std::promise<std::optional<db::model::UserRecord>> reply;
};

// ------------------------------------------------------------------
// Codes
// ------------------------------------------------------------------

struct AddCodeRequest {
  std::string        code;
  int32_t            message_ref = 0;
  std::promise<bool> reply;  // false when the code already exists
};

struct QueryCodeRequest {
  std::string                                        code;
  std::promise<std::optional<db::model::CodeRecord>> reply;
};

struct FinalizeCodeRequest {
  std::string                                        code;
  std::promise<std::optional<db::model::CodeRecord>> reply;
};

struct ResendCodeRequest {
  std::string        code;
  std::promise<bool> reply;  // false when the code is unknown
};

// ------------------------------------------------------------------
// Cookies
// ------------------------------------------------------------------

struct SetCookieRequest {
  int64_t                   owner = 0;
  std::string               id;
  std::string               csrf;
  std::string               session;
  std::promise<CookieWrite> reply;
};

struct ToggleCookieRequest {
  std::string        id;
  bool               enabled = true;
  std::promise<bool> reply;  // false when the cookie is unknown
};

struct CheckCookieCapacityRequest {
  std::string        id;
  int64_t            owner   = 0;
  uint32_t           ceiling = 0;
  std::promise<bool> reply;
};

struct QueryCookieRequest {
  std::string                                          id;
  std::promise<std::optional<db::model::CookieRecord>> reply;
};

struct QueryCookiesByOwnerRequest {
  int64_t                                           owner = 0;
  std::promise<std::vector<db::model::CookieRecord>> reply;
};

struct QueryAllCookiesRequest {
  bool                                               enabled_only = false;
  std::promise<std::vector<db::model::CookieRecord>> reply;
};

struct TouchCookieRequest {
  std::string        id;
  std::promise<bool> reply;  // false when the cookie is unknown
};

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

struct InsertHistoryRequest {
  std::string                session_id;
  std::string                code;
  std::optional<std::string> error;
  std::promise<void>         reply;
};

struct QueryHistoryRequest {
  std::optional<std::string>                          session_id;
  std::promise<std::vector<db::model::HistoryRecord>> reply;
};

// ------------------------------------------------------------------
// Meta
// ------------------------------------------------------------------

struct UpdateVersionStatusRequest {
  std::string        value;
  std::promise<bool> reply;  // true when the stored value changed
};

struct QueryVersionStatusRequest {
  std::promise<std::optional<db::model::VersionStatusRecord>> reply;
};

struct TerminateRequest {};

using Request = std::variant<AddUserRequest, ApproveUserRequest, RevokeUserRequest, QueryUserRequest,
                             AddCodeRequest, QueryCodeRequest, FinalizeCodeRequest, ResendCodeRequest,
                             SetCookieRequest, ToggleCookieRequest, CheckCookieCapacityRequest,
                             QueryCookieRequest, QueryCookiesByOwnerRequest, QueryAllCookiesRequest,
                             TouchCookieRequest, InsertHistoryRequest, QueryHistoryRequest,
                             UpdateVersionStatusRequest, QueryVersionStatusRequest, TerminateRequest>;

} // namespace codestaff::coordinator
