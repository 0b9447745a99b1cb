#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace codestaff::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  void Close() override;

  std::optional<model::UserRecord> FindUser(Transaction&, int64_t id) override;
  Result InsertUser(Transaction&, int64_t id, int32_t level) override;
  Result SetUserLevel(Transaction&, int64_t id, int32_t level) override;

  std::optional<model::CodeRecord> FindCode(Transaction&, const std::string& code) override;
  Result InsertCode(Transaction&, const std::string& code, int32_t message_ref) override;
  Result MarkFinalized(Transaction&, const std::string& code) override;

  std::optional<model::CookieRecord> FindCookie(Transaction&, const std::string& id) override;
  std::vector<model::CookieRecord> ListCookiesByOwner(Transaction&, int64_t owner) override;
  std::vector<model::CookieRecord> ListCookies(Transaction&, bool enabled_only) override;
  uint64_t CountCookiesByOwner(Transaction&, int64_t owner) override;
  Result UpsertCookie(Transaction&, int64_t owner, const std::string& id, const std::string& csrf,
                      const std::string& session, UpsertOutcome* outcome) override;
  Result SetCookieEnabled(Transaction&, const std::string& id, bool enabled) override;
  Result TouchCookie(Transaction&, const std::string& id, int64_t now) override;

  Result AppendHistory(Transaction&, const std::string& session_id, const std::string& code,
                       const std::optional<std::string>& error, int64_t now) override;
  std::vector<model::HistoryRecord> ListHistory(Transaction&, const std::optional<std::string>& session_id) override;

  std::optional<model::VersionStatusRecord> ReadVersionStatus(Transaction&) override;
  Result WriteVersionStatus(Transaction&, const model::VersionStatusRecord& status, bool* changed) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
