#include "finval/domain/account.h"

#include <iomanip>
#include <sstream>

namespace finval::domain {

std::string_view account_type_name(const AccountType type) noexcept {
  switch (type) {
    case AccountType::kChecking:
      return "checking";
    case AccountType::kSavings:
      return "savings";
  }
  return "checking";
}

std::optional<AccountType> parse_account_type(const std::string_view name) noexcept {
  if (name == "checking") {
    return AccountType::kChecking;
  }
  if (name == "savings") {
    return AccountType::kSavings;
  }
  return std::nullopt;
}

std::string_view account_status_name(const AccountStatus status) noexcept {
  switch (status) {
    case AccountStatus::kActive:
      return "active";
    case AccountStatus::kInactive:
      return "inactive";
  }
  return "inactive";
}

std::optional<AccountStatus> parse_account_status(const std::string_view name) noexcept {
  if (name == "active") {
    return AccountStatus::kActive;
  }
  if (name == "inactive") {
    return AccountStatus::kInactive;
  }
  return std::nullopt;
}

std::string format_account_number(const std::int64_t sequence, const AccountType type) {
  std::ostringstream out;
  out << (type == AccountType::kChecking ? "10" : "20") << std::setw(8) << std::setfill('0')
      << sequence;
  return out.str();
}

}  // namespace finval::domain
