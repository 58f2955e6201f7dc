#pragma once

#ifdef FINVAL_TRANSPORT_BOUNDARY_GUARD
#error "Concrete storage header included in a guarded translation unit; use interfaces only."
#endif

#include "finval/storage/repositories.h"
#include "finval/storage/sqlite/sqlite_db.h"

#include <memory>

namespace finval::storage::sqlite {

// SqliteAccountRepository implements IAccountRepository on the accounts and
// transactions tables. The account number is derived from the accounts rowid
// inside the inserting transaction; deposits write the ledger row and the
// balance in one BEGIN IMMEDIATE .. COMMIT.
class SqliteAccountRepository final : public IAccountRepository {
 public:
  explicit SqliteAccountRepository(std::shared_ptr<SqliteDb> db);

  core::Result<domain::Account, core::StorageError> insert(const domain::Account& draft) override;
  [[nodiscard]] std::optional<domain::Account> get(const core::AccountId& id) const override;
  [[nodiscard]] std::optional<domain::Account> find_by_user_and_type(
      const core::UserId& user_id, domain::AccountType type) const override;
  [[nodiscard]] std::vector<domain::Account> list_by_user(
      const core::UserId& user_id) const override;
  core::Result<domain::Account, core::StorageError> set_status(
      const core::AccountId& id, domain::AccountStatus status) override;

  core::Result<domain::Transaction, core::StorageError> record_deposit(
      const domain::Transaction& deposit) override;
  [[nodiscard]] std::optional<domain::Transaction> get_transaction(
      const core::TransactionId& id) const override;
  [[nodiscard]] std::vector<domain::Transaction> list_transactions(
      const core::AccountId& account_id) const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace finval::storage::sqlite
