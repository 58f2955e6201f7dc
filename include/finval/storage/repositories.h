#pragma once

#include "finval/core/ids.h"
#include "finval/core/result.h"
#include "finval/domain/account.h"
#include "finval/domain/transaction.h"
#include "finval/domain/user.h"

#include <optional>
#include <string>
#include <vector>

namespace finval::storage {

// Repository interfaces isolate persistence so flows run unchanged against
// in-memory maps in tests and SQLite in the server.

class IUserRepository {
 public:
  virtual ~IUserRepository() = default;

  // kConflict when the user_id or the (canonical) email is already registered.
  virtual core::Result<domain::User, core::StorageError> insert(const domain::User& user) = 0;
  [[nodiscard]] virtual std::optional<domain::User> get(const core::UserId& id) const = 0;
  [[nodiscard]] virtual std::optional<domain::User> find_by_email(
      const std::string& email) const = 0;

 protected:
  IUserRepository() = default;
  IUserRepository(const IUserRepository&) = default;
  IUserRepository& operator=(const IUserRepository&) = default;
  IUserRepository(IUserRepository&&) = default;
  IUserRepository& operator=(IUserRepository&&) = default;
};

// IAccountRepository owns accounts and their ledger. Balances change only
// through record_deposit, which writes the ledger row and the balance together.
class IAccountRepository {
 public:
  virtual ~IAccountRepository() = default;

  // Stores a new account and assigns its account_number from the storage sequence
  // (draft.account_number is ignored). kConflict when the user already holds an
  // account of the same type.
  virtual core::Result<domain::Account, core::StorageError> insert(
      const domain::Account& draft) = 0;
  [[nodiscard]] virtual std::optional<domain::Account> get(const core::AccountId& id) const = 0;
  [[nodiscard]] virtual std::optional<domain::Account> find_by_user_and_type(
      const core::UserId& user_id, domain::AccountType type) const = 0;
  [[nodiscard]] virtual std::vector<domain::Account> list_by_user(
      const core::UserId& user_id) const = 0;
  virtual core::Result<domain::Account, core::StorageError> set_status(
      const core::AccountId& id, domain::AccountStatus status) = 0;

  // Atomically inserts the deposit and adds its amount to the account balance.
  // kNotFound when the account does not exist; nothing is written on failure.
  virtual core::Result<domain::Transaction, core::StorageError> record_deposit(
      const domain::Transaction& deposit) = 0;
  [[nodiscard]] virtual std::optional<domain::Transaction> get_transaction(
      const core::TransactionId& id) const = 0;
  // Newest first (processed_at descending, then insertion order descending).
  [[nodiscard]] virtual std::vector<domain::Transaction> list_transactions(
      const core::AccountId& account_id) const = 0;

 protected:
  IAccountRepository() = default;
  IAccountRepository(const IAccountRepository&) = default;
  IAccountRepository& operator=(const IAccountRepository&) = default;
  IAccountRepository(IAccountRepository&&) = default;
  IAccountRepository& operator=(IAccountRepository&&) = default;
};

}  // namespace finval::storage
