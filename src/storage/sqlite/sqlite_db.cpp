#include "finval/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace finval::storage::sqlite {

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

namespace {

constexpr int kSchemaVersion = 1;

constexpr const char* kSchema = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS users (
  user_id TEXT PRIMARY KEY,
  email TEXT NOT NULL UNIQUE,
  password_hash TEXT NOT NULL,
  first_name TEXT NOT NULL,
  last_name TEXT NOT NULL,
  phone_number TEXT NOT NULL,
  date_of_birth TEXT NOT NULL,
  address TEXT NOT NULL,
  city TEXT NOT NULL,
  state TEXT NOT NULL,
  zip_code TEXT NOT NULL,
  created_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS accounts (
  seq INTEGER PRIMARY KEY AUTOINCREMENT,
  account_id TEXT NOT NULL UNIQUE,
  user_id TEXT NOT NULL,
  account_number TEXT NOT NULL UNIQUE,
  account_type TEXT NOT NULL CHECK(account_type IN ('checking', 'savings')),
  balance_cents INTEGER NOT NULL DEFAULT 0,
  status TEXT NOT NULL CHECK(status IN ('active', 'inactive')),
  created_at TEXT NOT NULL,
  UNIQUE(user_id, account_type),
  FOREIGN KEY(user_id) REFERENCES users(user_id)
);

CREATE TABLE IF NOT EXISTS transactions (
  seq INTEGER PRIMARY KEY AUTOINCREMENT,
  transaction_id TEXT NOT NULL UNIQUE,
  account_id TEXT NOT NULL,
  type TEXT NOT NULL,
  amount_cents INTEGER NOT NULL,
  description TEXT NOT NULL,
  status TEXT NOT NULL,
  processed_at TEXT NOT NULL,
  FOREIGN KEY(account_id) REFERENCES accounts(account_id)
);

CREATE INDEX IF NOT EXISTS idx_transactions_account
  ON transactions(account_id, processed_at);

CREATE TABLE IF NOT EXISTS audit_events (
  event_id TEXT PRIMARY KEY,
  trace_id TEXT NOT NULL,
  event_type TEXT NOT NULL,
  payload TEXT NOT NULL,
  created_at TEXT NOT NULL,
  refs_json TEXT NOT NULL,
  idx INTEGER NOT NULL,
  previous_hash TEXT NOT NULL,
  event_hash TEXT NOT NULL,
  UNIQUE(trace_id, idx)
);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

core::Result<bool, std::string> run_script(sqlite3* db, const char* sql, const char* what) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err(std::string{what} + ": " + error);
  }
  return core::Result<bool, std::string>::ok(true);
}

}  // namespace

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using OpenResult = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* raw = nullptr;
  const int rc = sqlite3_open(path.c_str(), &raw);
  // Take ownership first so every early return closes the handle.
  std::shared_ptr<SqliteDb> db(new SqliteDb(raw));
  if (rc != SQLITE_OK) {
    return OpenResult::err("Failed to open database: " + std::string{sqlite3_errmsg(raw)});
  }

  auto fk = run_script(raw, "PRAGMA foreign_keys = ON;", "Failed to enable foreign keys");
  if (!fk.has_value()) {
    return OpenResult::err(fk.error());
  }
  return OpenResult::ok(std::move(db));
}

int SqliteDb::schema_version() const {
  PreparedStatement stmt(db_.get(),
                         "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1");
  if (!stmt.is_valid()) {
    return 0;  // table does not exist yet
  }
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return static_cast<int>(stmt.column_int64(0));
  }
  return 0;
}

core::Result<bool, std::string> SqliteDb::ensure_schema() {
  if (schema_version() >= kSchemaVersion) {
    return core::Result<bool, std::string>::ok(true);
  }
  return run_script(db_.get(), kSchema, "Failed to apply schema v1");
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  return run_script(db_.get(), sql.c_str(), "SQL execution failed");
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw_stmt);
  } else {
    stmt_.reset(raw_stmt);
  }
}

void PreparedStatement::bind_text(const int index, const std::string& value) {
  sqlite3_bind_text(stmt_.get(), index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void PreparedStatement::bind_int64(const int index, const std::int64_t value) {
  sqlite3_bind_int64(stmt_.get(), index, static_cast<sqlite3_int64>(value));
}

std::string PreparedStatement::column_text(const int index) const {
  const unsigned char* raw = sqlite3_column_text(stmt_.get(), index);
  return raw == nullptr ? std::string{} : std::string{reinterpret_cast<const char*>(raw)};  // NOLINT
}

std::int64_t PreparedStatement::column_int64(const int index) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_.get(), index));
}

TransactionScope::TransactionScope(SqliteDb& db) : db_(db) {
  began_ = db_.exec("BEGIN IMMEDIATE").has_value();
}

TransactionScope::~TransactionScope() {
  if (began_ && !committed_) {
    // Rollback failure leaves nothing further to undo; SQLite discards the
    // pending transaction when the connection closes.
    static_cast<void>(db_.exec("ROLLBACK"));
  }
}

bool TransactionScope::commit() {
  if (!began_ || committed_) {
    return false;
  }
  committed_ = db_.exec("COMMIT").has_value();
  return committed_;
}

}  // namespace finval::storage::sqlite
