#pragma once

#include "finval/storage/repositories.h"

#include <cstdint>
#include <map>
#include <vector>

namespace finval::storage {

// InMemoryAccountRepository keeps accounts in a std::map (deterministic iteration
// by AccountId) and the ledger as an append-ordered vector.
class InMemoryAccountRepository final : public IAccountRepository {
 public:
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
  std::map<core::AccountId, domain::Account> accounts_;
  std::vector<domain::Transaction> ledger_;
  std::int64_t next_sequence_{1};
};

}  // namespace finval::storage
