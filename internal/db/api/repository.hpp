#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/code_record.hpp"
#include "internal/db/model/cookie_record.hpp"
#include "internal/db/model/history_record.hpp"
#include "internal/db/model/meta_record.hpp"
#include "internal/db/model/user_record.hpp"

namespace codestaff::db {

inline constexpr int kHistoryLimitAll     = 40;
inline constexpr int kHistoryLimitSession = 20;

enum class UpsertOutcome {
  Inserted,
  Updated,
  OwnerMismatch,
};

/*
  Repository abstraction.

  One operation per entity action. No business rules live here and
  nothing retries.

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Writes report failures through Result
  - Reads throw util::StoreError when the backend fails
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Releases the underlying connection. Further calls are invalid.
  virtual void Close() = 0;

  // ---------------------------------------------------------------------
  // Users
  // ---------------------------------------------------------------------

  virtual std::optional<model::UserRecord> FindUser(Transaction&, int64_t id) = 0;

  virtual Result InsertUser(Transaction&, int64_t id, int32_t level) = 0;

  // No write when the stored level already equals `level`.
  virtual Result SetUserLevel(Transaction&, int64_t id, int32_t level) = 0;

  // ---------------------------------------------------------------------
  // Codes
  // ---------------------------------------------------------------------

  virtual std::optional<model::CodeRecord> FindCode(Transaction&, const std::string& code) = 0;

  virtual Result InsertCode(Transaction&, const std::string& code, int32_t message_ref) = 0;

  virtual Result MarkFinalized(Transaction&, const std::string& code) = 0;

  // ---------------------------------------------------------------------
  // Cookies
  // ---------------------------------------------------------------------

  virtual std::optional<model::CookieRecord> FindCookie(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::CookieRecord> ListCookiesByOwner(Transaction&, int64_t owner) = 0;

  virtual std::vector<model::CookieRecord> ListCookies(Transaction&, bool enabled_only) = 0;

  virtual uint64_t CountCookiesByOwner(Transaction&, int64_t owner) = 0;

  // Insert when absent; update tokens when present and owned by `owner`;
  // otherwise leave the row untouched and report OwnerMismatch.
  virtual Result UpsertCookie(Transaction&, int64_t owner, const std::string& id, const std::string& csrf,
                              const std::string& session, UpsertOutcome* outcome) = 0;

  virtual Result SetCookieEnabled(Transaction&, const std::string& id, bool enabled) = 0;

  virtual Result TouchCookie(Transaction&, const std::string& id, int64_t now) = 0;

  // ---------------------------------------------------------------------
  // History
  // ---------------------------------------------------------------------

  virtual Result AppendHistory(Transaction&, const std::string& session_id, const std::string& code,
                               const std::optional<std::string>& error, int64_t now) = 0;

  // Newest first. Unfiltered: kHistoryLimitAll rows; filtered: kHistoryLimitSession.
  virtual std::vector<model::HistoryRecord> ListHistory(Transaction&, const std::optional<std::string>& session_id) = 0;

  // ---------------------------------------------------------------------
  // Meta
  // ---------------------------------------------------------------------

  virtual std::optional<model::VersionStatusRecord> ReadVersionStatus(Transaction&) = 0;

  // No write when the stored value already equals status.value.
  virtual Result WriteVersionStatus(Transaction&, const model::VersionStatusRecord& status, bool* changed) = 0;
};

} // namespace codestaff::db
