#pragma once

namespace codestaff::db::sql {

/*
  Table layouts per schema version.

  Only the current version is ever created from scratch; older layouts are
  kept so migrations (and their tests) know what they start from.
*/

inline constexpr int kSchemaVersionCurrent = 2;

inline constexpr const char* kCreateV1 = R"sql(
CREATE TABLE "users" (
  "id"          INTEGER NOT NULL,
  "authorized"  INTEGER NOT NULL,
  PRIMARY KEY("id")
);

CREATE TABLE "codes" (
  "code"         TEXT NOT NULL UNIQUE,
  "message_ref"  INTEGER NOT NULL,
  "finalized"    INTEGER NOT NULL DEFAULT 0,
  PRIMARY KEY("code")
);

CREATE TABLE "cookies" (
  "id"          TEXT NOT NULL,
  "csrf_token"  TEXT NOT NULL,
  "session_id"  TEXT NOT NULL,
  "last_login"  INTEGER NOT NULL,
  "belong"      INTEGER NOT NULL,
  PRIMARY KEY("id")
);

CREATE TABLE "history" (
  "timestamp"   INTEGER NOT NULL,
  "session_id"  TEXT NOT NULL,
  "code"        TEXT NOT NULL,
  "error"       TEXT
);

CREATE TABLE "meta" (
  "key"    TEXT NOT NULL,
  "value"  TEXT,
  PRIMARY KEY("key")
);

INSERT INTO "meta" VALUES ('version', '1');
)sql";

inline constexpr const char* kCreateV2 = R"sql(
CREATE TABLE "users" (
  "id"          INTEGER NOT NULL,
  "authorized"  INTEGER NOT NULL,
  PRIMARY KEY("id")
);

CREATE TABLE "codes" (
  "code"         TEXT NOT NULL UNIQUE,
  "message_ref"  INTEGER NOT NULL,
  "finalized"    INTEGER NOT NULL DEFAULT 0,
  PRIMARY KEY("code")
);

CREATE TABLE "cookies" (
  "id"          TEXT NOT NULL,
  "csrf_token"  TEXT NOT NULL,
  "session_id"  TEXT NOT NULL,
  "last_login"  INTEGER NOT NULL,
  "belong"      INTEGER NOT NULL,
  "enabled"     INTEGER NOT NULL DEFAULT 1,
  PRIMARY KEY("id")
);

CREATE TABLE "history" (
  "entry_id"    INTEGER PRIMARY KEY AUTOINCREMENT,
  "timestamp"   INTEGER NOT NULL,
  "session_id"  TEXT NOT NULL,
  "code"        TEXT NOT NULL,
  "error"       TEXT
);

CREATE INDEX "history_by_session" ON "history" ("session_id", "entry_id");

CREATE TABLE "meta" (
  "key"    TEXT NOT NULL,
  "value"  TEXT,
  PRIMARY KEY("key")
);

INSERT INTO "meta" VALUES ('version', '2');
)sql";

// history gets a surrogate key, cookies get the enabled flag.
// The version marker is advanced by the last statement.
inline constexpr const char* kMigrateV1ToV2 = R"sql(
CREATE TABLE "history_v2" (
  "entry_id"    INTEGER PRIMARY KEY AUTOINCREMENT,
  "timestamp"   INTEGER NOT NULL,
  "session_id"  TEXT NOT NULL,
  "code"        TEXT NOT NULL,
  "error"       TEXT
);

INSERT INTO "history_v2" ("timestamp", "session_id", "code", "error")
  SELECT "timestamp", "session_id", "code", "error" FROM "history" ORDER BY rowid;

DROP TABLE "history";
ALTER TABLE "history_v2" RENAME TO "history";
CREATE INDEX "history_by_session" ON "history" ("session_id", "entry_id");

ALTER TABLE "cookies" ADD COLUMN "enabled" INTEGER NOT NULL DEFAULT 1;

UPDATE "meta" SET "value" = '2' WHERE "key" = 'version';
)sql";

} // namespace codestaff::db::sql
