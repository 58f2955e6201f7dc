#include "finval/storage/inmemory_account_repository.h"

#include <algorithm>

namespace finval::storage {

using AccountResult = core::Result<domain::Account, core::StorageError>;
using TransactionResult = core::Result<domain::Transaction, core::StorageError>;

AccountResult InMemoryAccountRepository::insert(const domain::Account& draft) {
  if (accounts_.contains(draft.account_id) ||
      find_by_user_and_type(draft.user_id, draft.type).has_value()) {
    return AccountResult::err(core::StorageError::kConflict);
  }

  domain::Account stored = draft;
  stored.account_number = domain::format_account_number(next_sequence_++, draft.type);
  accounts_.emplace(stored.account_id, stored);
  return AccountResult::ok(stored);
}

std::optional<domain::Account> InMemoryAccountRepository::get(const core::AccountId& id) const {
  const auto it = accounts_.find(id);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Account> InMemoryAccountRepository::find_by_user_and_type(
    const core::UserId& user_id, const domain::AccountType type) const {
  for (const auto& [id, account] : accounts_) {
    if (account.user_id == user_id && account.type == type) {
      return account;
    }
  }
  return std::nullopt;
}

std::vector<domain::Account> InMemoryAccountRepository::list_by_user(
    const core::UserId& user_id) const {
  std::vector<domain::Account> owned;
  for (const auto& [id, account] : accounts_) {
    if (account.user_id == user_id) {
      owned.push_back(account);
    }
  }
  return owned;
}

AccountResult InMemoryAccountRepository::set_status(const core::AccountId& id,
                                                    const domain::AccountStatus status) {
  const auto it = accounts_.find(id);
  if (it == accounts_.end()) {
    return AccountResult::err(core::StorageError::kNotFound);
  }
  it->second.status = status;
  return AccountResult::ok(it->second);
}

TransactionResult InMemoryAccountRepository::record_deposit(const domain::Transaction& deposit) {
  const auto it = accounts_.find(deposit.account_id);
  if (it == accounts_.end()) {
    return TransactionResult::err(core::StorageError::kNotFound);
  }
  if (get_transaction(deposit.transaction_id).has_value()) {
    return TransactionResult::err(core::StorageError::kConflict);
  }

  ledger_.push_back(deposit);
  it->second.balance_cents += deposit.amount_cents;
  return TransactionResult::ok(deposit);
}

std::optional<domain::Transaction> InMemoryAccountRepository::get_transaction(
    const core::TransactionId& id) const {
  const auto it = std::find_if(ledger_.begin(), ledger_.end(), [&id](const domain::Transaction& t) {
    return t.transaction_id == id;
  });
  if (it == ledger_.end()) {
    return std::nullopt;
  }
  return *it;
}

std::vector<domain::Transaction> InMemoryAccountRepository::list_transactions(
    const core::AccountId& account_id) const {
  std::vector<domain::Transaction> rows;
  for (auto it = ledger_.rbegin(); it != ledger_.rend(); ++it) {
    if (it->account_id == account_id) {
      rows.push_back(*it);
    }
  }
  // Reverse append order is the tie-break; stable_sort keeps it.
  std::stable_sort(rows.begin(), rows.end(),
                   [](const domain::Transaction& a, const domain::Transaction& b) {
                     return a.processed_at > b.processed_at;
                   });
  return rows;
}

}  // namespace finval::storage
