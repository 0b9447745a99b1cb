#include "sqlite_repository.hpp"

#include <google/protobuf/util/json_util.h>
#include <sqlite3.h>

#include "codestaff/v1/state.pb.h"
#include "internal/util/errors.hpp"

namespace codestaff::db::sqlite {

using codestaff::db::ErrorCode;
using codestaff::db::Result;
using codestaff::util::StoreError;

namespace {

constexpr const char* kCookieColumns = "SELECT id,csrf_token,session_id,last_login,belong,enabled FROM cookies";

// Owns one prepared statement for the duration of a repository call.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
    }

    ~Statement() {
        if (st_) sqlite3_finalize(st_);
    }

    Statement(const Statement&)            = delete;
    Statement& operator=(const Statement&) = delete;

    bool Ok() const {
        return rc_ == SQLITE_OK && st_ != nullptr;
    }

    sqlite3_stmt* Get() const {
        return st_;
    }

    // For read paths: prepare failures are store failures.
    void Require(const char* what) const {
        if (!Ok()) throw StoreError(std::string(what) + ": " + sqlite3_errmsg(db_));
    }

    // Returns true on SQLITE_ROW, false on SQLITE_DONE, throws otherwise.
    bool StepRow(const char* what) {
        int rc = sqlite3_step(st_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError(std::string(what) + ": " + sqlite3_errmsg(db_));
    }

private:
    sqlite3*      db_ = nullptr;
    sqlite3_stmt* st_ = nullptr;
    int           rc_ = SQLITE_ERROR;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

model::CookieRecord ReadCookie(sqlite3_stmt* st) {
    model::CookieRecord r;
    r.id         = ColText(st, 0);
    r.csrf_token = ColText(st, 1);
    r.session_id = ColText(st, 2);
    r.last_login = ColI64(st, 3);
    r.belong     = ColI64(st, 4);
    r.enabled    = ColI32(st, 5) != 0;
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

void SqliteRepository::Close() {
    db_->Close();
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

std::optional<model::UserRecord> SqliteRepository::FindUser(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT id,authorized FROM users WHERE id=?;");
    st.Require("find user");
    BindI64(st.Get(), 1, id);

    if (!st.StepRow("find user")) return std::nullopt;

    model::UserRecord r;
    r.id = ColI64(st.Get(), 0);
    r.authorized = ColI32(st.Get(), 1);
    return r;
}

Result SqliteRepository::InsertUser(Transaction& t, int64_t id, int32_t level) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO users(id,authorized) VALUES(?,?);");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.Get(), 1, id);
    BindI32(st.Get(), 2, level);

    return Translate(db, sqlite3_step(st.Get()));
}

Result SqliteRepository::SetUserLevel(Transaction& t, int64_t id, int32_t level) {
    auto current = FindUser(t, id);
    if (!current) return Result::Err(ErrorCode::NotFound, "user " + std::to_string(id));
    if (current->authorized == level) return Result::Ok();

    auto* db = TX(t).Handle();

    Statement st(db, "UPDATE users SET authorized=? WHERE id=?;");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st.Get(), 1, level);
    BindI64(st.Get(), 2, id);

    return Translate(db, sqlite3_step(st.Get()));
}

// ------------------------------------------------------------------
// Codes
// ------------------------------------------------------------------

std::optional<model::CodeRecord> SqliteRepository::FindCode(Transaction& t, const std::string& code) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT code,message_ref,finalized FROM codes WHERE code=?;");
    st.Require("find code");
    BindText(st.Get(), 1, code);

    if (!st.StepRow("find code")) return std::nullopt;

    model::CodeRecord r;
    r.code = ColText(st.Get(), 0);
    r.message_ref = ColI32(st.Get(), 1);
    r.finalized = ColI32(st.Get(), 2) != 0;
    return r;
}

Result SqliteRepository::InsertCode(Transaction& t, const std::string& code, int32_t message_ref) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO codes(code,message_ref,finalized) VALUES(?,?,0);");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, code);
    BindI32(st.Get(), 2, message_ref);

    return Translate(db, sqlite3_step(st.Get()));
}

Result SqliteRepository::MarkFinalized(Transaction& t, const std::string& code) {
    auto* db = TX(t).Handle();

    // finalized never goes back to 0, so repeating this is harmless
    Statement st(db, "UPDATE codes SET finalized=1 WHERE code=?;");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, code);

    auto r = Translate(db, sqlite3_step(st.Get()));
    if (r && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "code " + code);
    return r;
}

// ------------------------------------------------------------------
// Cookies
// ------------------------------------------------------------------

std::optional<model::CookieRecord> SqliteRepository::FindCookie(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kCookieColumns) + " WHERE id=?;";
    Statement st(db, sql.c_str());
    st.Require("find cookie");
    BindText(st.Get(), 1, id);

    if (!st.StepRow("find cookie")) return std::nullopt;
    return ReadCookie(st.Get());
}

std::vector<model::CookieRecord> SqliteRepository::ListCookiesByOwner(Transaction& t, int64_t owner) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kCookieColumns) + " WHERE belong=? ORDER BY id;";
    Statement st(db, sql.c_str());
    st.Require("list cookies by owner");
    BindI64(st.Get(), 1, owner);

    std::vector<model::CookieRecord> out;
    while (st.StepRow("list cookies by owner")) {
        out.push_back(ReadCookie(st.Get()));
    }
    return out;
}

std::vector<model::CookieRecord> SqliteRepository::ListCookies(Transaction& t, bool enabled_only) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kCookieColumns) +
        (enabled_only ? " WHERE enabled=1" : "") + " ORDER BY belong,id;";
    Statement st(db, sql.c_str());
    st.Require("list cookies");

    std::vector<model::CookieRecord> out;
    while (st.StepRow("list cookies")) {
        out.push_back(ReadCookie(st.Get()));
    }
    return out;
}

uint64_t SqliteRepository::CountCookiesByOwner(Transaction& t, int64_t owner) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT COUNT(*) FROM cookies WHERE belong=?;");
    st.Require("count cookies");
    BindI64(st.Get(), 1, owner);

    if (!st.StepRow("count cookies")) return 0;
    return static_cast<uint64_t>(ColI64(st.Get(), 0));
}

Result SqliteRepository::UpsertCookie(Transaction& t, int64_t owner, const std::string& id,
                                      const std::string& csrf, const std::string& session,
                                      UpsertOutcome* outcome) {
    auto* db = TX(t).Handle();

    if (auto existing = FindCookie(t, id)) {
        if (existing->belong != owner) {
            *outcome = UpsertOutcome::OwnerMismatch;
            return Result::Ok();
        }

        Statement st(db, "UPDATE cookies SET csrf_token=?,session_id=? WHERE id=?;");
        if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

        BindText(st.Get(), 1, csrf);
        BindText(st.Get(), 2, session);
        BindText(st.Get(), 3, id);

        auto r = Translate(db, sqlite3_step(st.Get()));
        if (r) *outcome = UpsertOutcome::Updated;
        return r;
    }

    Statement st(db,
        "INSERT INTO cookies(id,csrf_token,session_id,last_login,belong,enabled) "
        "VALUES(?,?,?,0,?,1);");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, id);
    BindText(st.Get(), 2, csrf);
    BindText(st.Get(), 3, session);
    BindI64(st.Get(), 4, owner);

    auto r = Translate(db, sqlite3_step(st.Get()));
    if (r) *outcome = UpsertOutcome::Inserted;
    return r;
}

Result SqliteRepository::SetCookieEnabled(Transaction& t, const std::string& id, bool enabled) {
    auto* db = TX(t).Handle();

    Statement st(db, "UPDATE cookies SET enabled=? WHERE id=?;");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st.Get(), 1, enabled ? 1 : 0);
    BindText(st.Get(), 2, id);

    auto r = Translate(db, sqlite3_step(st.Get()));
    if (r && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "cookie " + id);
    return r;
}

Result SqliteRepository::TouchCookie(Transaction& t, const std::string& id, int64_t now) {
    auto* db = TX(t).Handle();

    Statement st(db, "UPDATE cookies SET last_login=? WHERE id=?;");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.Get(), 1, now);
    BindText(st.Get(), 2, id);

    auto r = Translate(db, sqlite3_step(st.Get()));
    if (r && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "cookie " + id);
    return r;
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result SqliteRepository::AppendHistory(Transaction& t, const std::string& session_id, const std::string& code,
                                       const std::optional<std::string>& error, int64_t now) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO history(timestamp,session_id,code,error) VALUES(?,?,?,?);");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.Get(), 1, now);
    BindText(st.Get(), 2, session_id);
    BindText(st.Get(), 3, code);
    if (error) {
        BindText(st.Get(), 4, *error);
    } else {
        sqlite3_bind_null(st.Get(), 4);
    }

    return Translate(db, sqlite3_step(st.Get()));
}

std::vector<model::HistoryRecord>
SqliteRepository::ListHistory(Transaction& t, const std::optional<std::string>& session_id) {
    auto* db = TX(t).Handle();

    const char* sql = session_id
        ? "SELECT entry_id,timestamp,session_id,code,error FROM history "
          "WHERE session_id=? ORDER BY entry_id DESC LIMIT ?;"
        : "SELECT entry_id,timestamp,session_id,code,error FROM history "
          "ORDER BY entry_id DESC LIMIT ?;";

    Statement st(db, sql);
    st.Require("list history");
    if (session_id) {
        BindText(st.Get(), 1, *session_id);
        BindI32(st.Get(), 2, kHistoryLimitSession);
    } else {
        BindI32(st.Get(), 1, kHistoryLimitAll);
    }

    std::vector<model::HistoryRecord> out;
    while (st.StepRow("list history")) {
        model::HistoryRecord r;
        r.entry_id = ColI64(st.Get(), 0);
        r.timestamp = ColI64(st.Get(), 1);
        r.session_id = ColText(st.Get(), 2);
        r.code = ColText(st.Get(), 3);
        r.error = ColOptText(st.Get(), 4);
        out.push_back(std::move(r));
    }
    return out;
}

// ------------------------------------------------------------------
// Meta
// ------------------------------------------------------------------

std::optional<model::VersionStatusRecord> SqliteRepository::ReadVersionStatus(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT value FROM meta WHERE key=?;");
    st.Require("read version status");
    BindText(st.Get(), 1, model::kMetaVersionStatusKey);

    if (!st.StepRow("read version status")) return std::nullopt;
    const auto json = ColText(st.Get(), 0);

    codestaff::v1::VersionStatus status;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    auto parsed = google::protobuf::util::JsonStringToMessage(json, &status, options);
    if (!parsed.ok()) {
        throw StoreError("decode meta['" + std::string(model::kMetaVersionStatusKey) + "']: " +
                         std::string(parsed.message()));
    }

    model::VersionStatusRecord r;
    r.value = status.v();
    r.last_seen = status.last();
    return r;
}

Result SqliteRepository::WriteVersionStatus(Transaction& t, const model::VersionStatusRecord& status, bool* changed) {
    *changed = false;
    if (auto current = ReadVersionStatus(t); current && current->value == status.value) {
        return Result::Ok();
    }

    codestaff::v1::VersionStatus message;
    message.set_v(status.value);
    message.set_last(static_cast<uint32_t>(status.last_seen));

    std::string json;
    auto encoded = google::protobuf::util::MessageToJsonString(message, &json);
    if (!encoded.ok()) return Result::Err(ErrorCode::InternalError, std::string(encoded.message()));

    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO meta(key,value) VALUES(?,?) "
        "ON CONFLICT(key) DO UPDATE SET value=excluded.value;");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, model::kMetaVersionStatusKey);
    BindText(st.Get(), 2, json);

    auto r = Translate(db, sqlite3_step(st.Get()));
    if (r) *changed = true;
    return r;
}

} // namespace codestaff::db::sqlite
