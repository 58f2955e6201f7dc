#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace finval::domain {

enum class FundingSourceType {
  kCard,
  kBank,
};

[[nodiscard]] std::string_view funding_source_type_name(FundingSourceType type) noexcept;
[[nodiscard]] std::optional<FundingSourceType> parse_funding_source_type(
    std::string_view name) noexcept;

// FundingSource is where a deposit comes from. For a card, account_number is the
// card number; for a bank, it is the bank account number and routing_number is
// mandatory. Neither number is ever persisted or echoed.
struct FundingSource {
  FundingSourceType type{FundingSourceType::kCard};
  std::string account_number;
  std::optional<std::string> routing_number;
};

}  // namespace finval::domain
