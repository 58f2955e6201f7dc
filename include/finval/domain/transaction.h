#pragma once

#include "finval/core/ids.h"
#include "finval/core/types.h"

#include <string>

namespace finval::domain {

// Transaction is an immutable ledger row. Deposits are the only kind the
// funding flow creates.
struct Transaction {
  core::TransactionId transaction_id;
  core::AccountId account_id;
  std::string type{"deposit"};
  core::Cents amount_cents{0};
  std::string description;
  std::string status{"completed"};
  std::string processed_at;
};

}  // namespace finval::domain
