#pragma once

#include "finval/core/result.h"

#include <cstdint>
#include <memory>
#include <string>

// Forward declare sqlite3 to keep the SQLite header out of the public API
struct sqlite3;
struct sqlite3_stmt;

namespace finval::storage::sqlite {

// SqliteDb owns one SQLite connection for the lifetime of the process.
// The connection is closed by RAII (unique_ptr with a custom deleter).
// Foreign keys are enabled on open; ensure_schema() is idempotent.
class SqliteDb {
 public:
  // ":memory:" opens a private in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // 0 when no schema has been applied.
  [[nodiscard]] int schema_version() const;

  // Creates users, accounts, transactions and audit_events if absent.
  // Safe to call on every start.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // For repository implementations only.
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// RAII wrapper for prepared statements.
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  void bind_text(int index, const std::string& value);
  void bind_int64(int index, std::int64_t value);

  // Column accessors for the current row. NULL text reads as "".
  [[nodiscard]] std::string column_text(int index) const;
  [[nodiscard]] std::int64_t column_int64(int index) const;

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

// TransactionScope issues BEGIN IMMEDIATE on construction and rolls back on
// destruction unless commit() succeeded.
class TransactionScope {
 public:
  explicit TransactionScope(SqliteDb& db);
  ~TransactionScope();

  TransactionScope(const TransactionScope&) = delete;
  TransactionScope& operator=(const TransactionScope&) = delete;
  TransactionScope(TransactionScope&&) = delete;
  TransactionScope& operator=(TransactionScope&&) = delete;

  [[nodiscard]] bool began() const { return began_; }
  [[nodiscard]] bool commit();

 private:
  SqliteDb& db_;
  bool began_{false};
  bool committed_{false};
};

}  // namespace finval::storage::sqlite
