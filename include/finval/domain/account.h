#pragma once

#include "finval/core/ids.h"
#include "finval/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace finval::domain {

enum class AccountType {
  kChecking,
  kSavings,
};

enum class AccountStatus {
  kActive,
  kInactive,
};

[[nodiscard]] std::string_view account_type_name(AccountType type) noexcept;
[[nodiscard]] std::optional<AccountType> parse_account_type(std::string_view name) noexcept;

[[nodiscard]] std::string_view account_status_name(AccountStatus status) noexcept;
[[nodiscard]] std::optional<AccountStatus> parse_account_status(std::string_view name) noexcept;

// Account holds a balance in integer cents. A user owns at most one account per type.
struct Account {
  core::AccountId account_id;
  core::UserId user_id;
  std::string account_number;
  AccountType type{AccountType::kChecking};
  core::Cents balance_cents{0};
  AccountStatus status{AccountStatus::kActive};
  std::string created_at;

  [[nodiscard]] bool is_active() const noexcept { return status == AccountStatus::kActive; }
};

// format_account_number renders the 10-digit customer-facing number:
// "10" (checking) or "20" (savings) followed by the zero-padded storage sequence.
[[nodiscard]] std::string format_account_number(std::int64_t sequence, AccountType type);

}  // namespace finval::domain
