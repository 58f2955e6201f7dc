#pragma once

#include "finval/domain/account.h"
#include "finval/domain/transaction.h"
#include "finval/domain/user.h"

#include <nlohmann/json.hpp>

namespace finval::domain {

// Public views. The password hash is never serialized.
[[nodiscard]] nlohmann::json user_to_json(const User& user);
[[nodiscard]] nlohmann::json account_to_json(const Account& account);
[[nodiscard]] nlohmann::json transaction_to_json(const Transaction& transaction);

}  // namespace finval::domain
