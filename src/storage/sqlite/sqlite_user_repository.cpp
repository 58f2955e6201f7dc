#include "finval/storage/sqlite/sqlite_user_repository.h"

#include <sqlite3.h>

namespace finval::storage::sqlite {

namespace {

using UserResult = core::Result<domain::User, core::StorageError>;

constexpr const char* kSelectColumns =
    "SELECT user_id, email, password_hash, first_name, last_name, phone_number,"
    "       date_of_birth, address, city, state, zip_code, created_at FROM users ";

domain::User row_to_user(const PreparedStatement& stmt) {
  domain::User user;
  user.user_id = core::UserId{stmt.column_text(0)};
  user.email = stmt.column_text(1);
  user.password_hash = stmt.column_text(2);
  user.first_name = stmt.column_text(3);
  user.last_name = stmt.column_text(4);
  user.phone_number = stmt.column_text(5);
  user.date_of_birth = stmt.column_text(6);
  user.address = stmt.column_text(7);
  user.city = stmt.column_text(8);
  user.state = stmt.column_text(9);
  user.zip_code = stmt.column_text(10);
  user.created_at = stmt.column_text(11);
  return user;
}

}  // namespace

SqliteUserRepository::SqliteUserRepository(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

UserResult SqliteUserRepository::insert(const domain::User& user) {
  PreparedStatement stmt(db_->connection(), R"(
    INSERT INTO users (user_id, email, password_hash, first_name, last_name, phone_number,
                       date_of_birth, address, city, state, zip_code, created_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
  )");
  if (!stmt.is_valid()) {
    return UserResult::err(core::StorageError::kUnavailable);
  }

  stmt.bind_text(1, user.user_id.value);
  stmt.bind_text(2, user.email);
  stmt.bind_text(3, user.password_hash);
  stmt.bind_text(4, user.first_name);
  stmt.bind_text(5, user.last_name);
  stmt.bind_text(6, user.phone_number);
  stmt.bind_text(7, user.date_of_birth);
  stmt.bind_text(8, user.address);
  stmt.bind_text(9, user.city);
  stmt.bind_text(10, user.state);
  stmt.bind_text(11, user.zip_code);
  stmt.bind_text(12, user.created_at);

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_CONSTRAINT) {
    return UserResult::err(core::StorageError::kConflict);
  }
  if (rc != SQLITE_DONE) {
    return UserResult::err(core::StorageError::kUnavailable);
  }
  return UserResult::ok(user);
}

std::optional<domain::User> SqliteUserRepository::get(const core::UserId& id) const {
  return select_one("WHERE user_id = ?", id.value);
}

std::optional<domain::User> SqliteUserRepository::find_by_email(const std::string& email) const {
  return select_one("WHERE email = ?", email);
}

std::optional<domain::User> SqliteUserRepository::select_one(const char* where,
                                                             const std::string& key) const {
  PreparedStatement stmt(db_->connection(), std::string{kSelectColumns} + where);
  if (!stmt.is_valid()) {
    return std::nullopt;
  }
  stmt.bind_text(1, key);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return row_to_user(stmt);
  }
  return std::nullopt;
}

}  // namespace finval::storage::sqlite
