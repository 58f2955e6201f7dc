#include "finval/domain/funding_source.h"

namespace finval::domain {

std::string_view funding_source_type_name(const FundingSourceType type) noexcept {
  return type == FundingSourceType::kCard ? "card" : "bank";
}

std::optional<FundingSourceType> parse_funding_source_type(const std::string_view name) noexcept {
  if (name == "card") {
    return FundingSourceType::kCard;
  }
  if (name == "bank") {
    return FundingSourceType::kBank;
  }
  return std::nullopt;
}

}  // namespace finval::domain
