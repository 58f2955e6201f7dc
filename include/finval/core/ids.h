#pragma once

#include "finval/core/id_generator.h"

#include <string>

namespace finval::core {

// Strong ids: a UserId cannot be passed where an AccountId is expected.

struct UserId {
  std::string value;
  auto operator<=>(const UserId&) const = default;
};

struct AccountId {
  std::string value;
  auto operator<=>(const AccountId&) const = default;
};

struct TransactionId {
  std::string value;
  auto operator<=>(const TransactionId&) const = default;
};

struct TraceId {
  std::string value;
  auto operator<=>(const TraceId&) const = default;
};

inline UserId new_user_id(IIdGenerator& gen) { return UserId{gen.next(id_prefix::kUser)}; }
inline AccountId new_account_id(IIdGenerator& gen) {
  return AccountId{gen.next(id_prefix::kAccount)};
}
inline TransactionId new_transaction_id(IIdGenerator& gen) {
  return TransactionId{gen.next(id_prefix::kTransaction)};
}
inline TraceId new_trace_id(IIdGenerator& gen) { return TraceId{gen.next(id_prefix::kTrace)}; }

}  // namespace finval::core
