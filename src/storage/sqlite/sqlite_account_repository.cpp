#include "finval/storage/sqlite/sqlite_account_repository.h"

#include <sqlite3.h>

namespace finval::storage::sqlite {

namespace {

using AccountResult = core::Result<domain::Account, core::StorageError>;
using TransactionResult = core::Result<domain::Transaction, core::StorageError>;

constexpr const char* kAccountColumns =
    "SELECT account_id, user_id, account_number, account_type, balance_cents, status,"
    "       created_at FROM accounts ";

constexpr const char* kTransactionColumns =
    "SELECT transaction_id, account_id, type, amount_cents, description, status,"
    "       processed_at FROM transactions ";

domain::Account row_to_account(const PreparedStatement& stmt) {
  domain::Account account;
  account.account_id = core::AccountId{stmt.column_text(0)};
  account.user_id = core::UserId{stmt.column_text(1)};
  account.account_number = stmt.column_text(2);
  account.type = domain::parse_account_type(stmt.column_text(3))
                     .value_or(domain::AccountType::kChecking);
  account.balance_cents = stmt.column_int64(4);
  // Unknown status strings read as inactive so a damaged row never accepts funds.
  account.status = domain::parse_account_status(stmt.column_text(5))
                       .value_or(domain::AccountStatus::kInactive);
  account.created_at = stmt.column_text(6);
  return account;
}

domain::Transaction row_to_transaction(const PreparedStatement& stmt) {
  domain::Transaction transaction;
  transaction.transaction_id = core::TransactionId{stmt.column_text(0)};
  transaction.account_id = core::AccountId{stmt.column_text(1)};
  transaction.type = stmt.column_text(2);
  transaction.amount_cents = stmt.column_int64(3);
  transaction.description = stmt.column_text(4);
  transaction.status = stmt.column_text(5);
  transaction.processed_at = stmt.column_text(6);
  return transaction;
}

std::vector<domain::Account> collect_accounts(PreparedStatement& stmt) {
  std::vector<domain::Account> rows;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    rows.push_back(row_to_account(stmt));
  }
  return rows;
}

}  // namespace

SqliteAccountRepository::SqliteAccountRepository(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

AccountResult SqliteAccountRepository::insert(const domain::Account& draft) {
  TransactionScope tx(*db_);
  if (!tx.began()) {
    return AccountResult::err(core::StorageError::kUnavailable);
  }

  // The account_id doubles as a unique placeholder until the rowid is known.
  PreparedStatement insert(db_->connection(), R"(
    INSERT INTO accounts (account_id, user_id, account_number, account_type, balance_cents,
                          status, created_at)
    VALUES (?, ?, ?, ?, ?, ?, ?)
  )");
  if (!insert.is_valid()) {
    return AccountResult::err(core::StorageError::kUnavailable);
  }
  insert.bind_text(1, draft.account_id.value);
  insert.bind_text(2, draft.user_id.value);
  insert.bind_text(3, draft.account_id.value);
  insert.bind_text(4, std::string{domain::account_type_name(draft.type)});
  insert.bind_int64(5, draft.balance_cents);
  insert.bind_text(6, std::string{domain::account_status_name(draft.status)});
  insert.bind_text(7, draft.created_at);

  const int rc = sqlite3_step(insert.get());
  if (rc == SQLITE_CONSTRAINT) {
    return AccountResult::err(core::StorageError::kConflict);
  }
  if (rc != SQLITE_DONE) {
    return AccountResult::err(core::StorageError::kUnavailable);
  }

  domain::Account stored = draft;
  stored.account_number = domain::format_account_number(
      static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_->connection())), draft.type);

  PreparedStatement number(db_->connection(),
                           "UPDATE accounts SET account_number = ? WHERE account_id = ?");
  if (!number.is_valid()) {
    return AccountResult::err(core::StorageError::kUnavailable);
  }
  number.bind_text(1, stored.account_number);
  number.bind_text(2, stored.account_id.value);
  if (sqlite3_step(number.get()) != SQLITE_DONE || !tx.commit()) {
    return AccountResult::err(core::StorageError::kUnavailable);
  }
  return AccountResult::ok(stored);
}

std::optional<domain::Account> SqliteAccountRepository::get(const core::AccountId& id) const {
  PreparedStatement stmt(db_->connection(), std::string{kAccountColumns} + "WHERE account_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }
  stmt.bind_text(1, id.value);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return row_to_account(stmt);
  }
  return std::nullopt;
}

std::optional<domain::Account> SqliteAccountRepository::find_by_user_and_type(
    const core::UserId& user_id, const domain::AccountType type) const {
  PreparedStatement stmt(db_->connection(), std::string{kAccountColumns} +
                                                "WHERE user_id = ? AND account_type = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }
  stmt.bind_text(1, user_id.value);
  stmt.bind_text(2, std::string{domain::account_type_name(type)});
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return row_to_account(stmt);
  }
  return std::nullopt;
}

std::vector<domain::Account> SqliteAccountRepository::list_by_user(
    const core::UserId& user_id) const {
  PreparedStatement stmt(db_->connection(), std::string{kAccountColumns} +
                                                "WHERE user_id = ? ORDER BY account_id");
  if (!stmt.is_valid()) {
    return {};
  }
  stmt.bind_text(1, user_id.value);
  return collect_accounts(stmt);
}

AccountResult SqliteAccountRepository::set_status(const core::AccountId& id,
                                                  const domain::AccountStatus status) {
  PreparedStatement stmt(db_->connection(), "UPDATE accounts SET status = ? WHERE account_id = ?");
  if (!stmt.is_valid()) {
    return AccountResult::err(core::StorageError::kUnavailable);
  }
  stmt.bind_text(1, std::string{domain::account_status_name(status)});
  stmt.bind_text(2, id.value);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return AccountResult::err(core::StorageError::kUnavailable);
  }
  if (sqlite3_changes(db_->connection()) == 0) {
    return AccountResult::err(core::StorageError::kNotFound);
  }

  auto updated = get(id);
  if (!updated.has_value()) {
    return AccountResult::err(core::StorageError::kUnavailable);
  }
  return AccountResult::ok(*updated);
}

TransactionResult SqliteAccountRepository::record_deposit(const domain::Transaction& deposit) {
  TransactionScope tx(*db_);
  if (!tx.began()) {
    return TransactionResult::err(core::StorageError::kUnavailable);
  }

  PreparedStatement credit(db_->connection(),
                           "UPDATE accounts SET balance_cents = balance_cents + ? "
                           "WHERE account_id = ?");
  if (!credit.is_valid()) {
    return TransactionResult::err(core::StorageError::kUnavailable);
  }
  credit.bind_int64(1, deposit.amount_cents);
  credit.bind_text(2, deposit.account_id.value);
  if (sqlite3_step(credit.get()) != SQLITE_DONE) {
    return TransactionResult::err(core::StorageError::kUnavailable);
  }
  if (sqlite3_changes(db_->connection()) == 0) {
    return TransactionResult::err(core::StorageError::kNotFound);
  }

  PreparedStatement row(db_->connection(), R"(
    INSERT INTO transactions (transaction_id, account_id, type, amount_cents, description,
                              status, processed_at)
    VALUES (?, ?, ?, ?, ?, ?, ?)
  )");
  if (!row.is_valid()) {
    return TransactionResult::err(core::StorageError::kUnavailable);
  }
  row.bind_text(1, deposit.transaction_id.value);
  row.bind_text(2, deposit.account_id.value);
  row.bind_text(3, deposit.type);
  row.bind_int64(4, deposit.amount_cents);
  row.bind_text(5, deposit.description);
  row.bind_text(6, deposit.status);
  row.bind_text(7, deposit.processed_at);

  const int rc = sqlite3_step(row.get());
  if (rc == SQLITE_CONSTRAINT) {
    return TransactionResult::err(core::StorageError::kConflict);
  }
  if (rc != SQLITE_DONE || !tx.commit()) {
    return TransactionResult::err(core::StorageError::kUnavailable);
  }
  return TransactionResult::ok(deposit);
}

std::optional<domain::Transaction> SqliteAccountRepository::get_transaction(
    const core::TransactionId& id) const {
  PreparedStatement stmt(db_->connection(),
                         std::string{kTransactionColumns} + "WHERE transaction_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }
  stmt.bind_text(1, id.value);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return row_to_transaction(stmt);
  }
  return std::nullopt;
}

std::vector<domain::Transaction> SqliteAccountRepository::list_transactions(
    const core::AccountId& account_id) const {
  PreparedStatement stmt(db_->connection(),
                         std::string{kTransactionColumns} +
                             "WHERE account_id = ? ORDER BY processed_at DESC, seq DESC");
  if (!stmt.is_valid()) {
    return {};
  }
  stmt.bind_text(1, account_id.value);

  std::vector<domain::Transaction> rows;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    rows.push_back(row_to_transaction(stmt));
  }
  return rows;
}

}  // namespace finval::storage::sqlite
