#include "account_logic.h"

#include "finval/app/app_service.h"
#include "finval/domain/account.h"
#include "finval/domain/domain_json.h"
#include "finval/domain/funding_source.h"
#include "finval/validation/amount.h"
#include "finval/validation/field_rules.h"

#include <nlohmann/json.hpp>

#include "prompt.h"
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

finval::validation::FieldFinding check_source_type(std::optional<std::string_view> raw) {
  if (raw.has_value() && finval::domain::parse_funding_source_type(*raw).has_value()) {
    return finval::validation::accepted_finding("funding_source.type", std::string{*raw});
  }
  return finval::validation::rejected_finding("funding_source.type",
                                              finval::validation::ErrorCode::kFormat,
                                              "Enter card or bank");
}

FieldCheck field_check(finval::validation::Field field) {
  return [field](std::optional<std::string_view> raw) {
    return finval::validation::validate_field(field, raw);
  };
}

}  // namespace

int execute_create_account(const std::string& user_id, const std::string& account_type,
                           std::ostream& out, finval::core::Services& services,
                           finval::core::IIdGenerator& id_gen, finval::core::IClock& clock) {
  const auto type = finval::domain::parse_account_type(account_type);
  if (!type.has_value()) {
    std::cerr << "Invalid account type: " << account_type << " (valid: checking, savings)\n";
    return 1;
  }

  const finval::app::CreateAccountRequest request{
      .user_id = finval::core::UserId{user_id},
      .account_type = *type,
      .trace_id = std::nullopt,
  };
  try {
    auto outcome = finval::app::run_create_account(request, services, id_gen, clock);
    if (!outcome.has_value()) {
      std::cerr << "Account creation failed: " << outcome.error().message << "\n";
      return 1;
    }

    out << finval::domain::account_to_json(outcome.value().account).dump(2) << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: account creation failed: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

int execute_list_accounts(const std::string& user_id, std::ostream& out,
                          finval::core::Services& services) {
  nlohmann::json listing;
  listing["user_id"] = user_id;
  listing["accounts"] = nlohmann::json::array();
  try {
    for (const auto& account :
         finval::app::list_accounts(finval::core::UserId{user_id}, services)) {
      listing["accounts"].push_back(finval::domain::account_to_json(account));
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: listing accounts failed: " << e.what() << "\n";
    return 1;
  }
  out << listing.dump(2) << "\n";
  return 0;
}

int execute_fund(std::istream& in, std::ostream& out, const std::string& user_id,
                 const std::string& account_id, finval::core::Services& services,
                 finval::core::IIdGenerator& id_gen, finval::core::IClock& clock) {
  using finval::validation::Field;

  const auto amount = prompt_until_valid(in, out, "Amount", field_check(Field::kAmount));
  if (!amount.has_value()) {
    std::cerr << "Funding cancelled: input ended\n";
    return 1;
  }
  const auto source_type = prompt_until_valid(in, out, "Funding source (card/bank)",
                                              check_source_type);
  if (!source_type.has_value()) {
    std::cerr << "Funding cancelled: input ended\n";
    return 1;
  }

  finval::domain::FundingSource source;
  source.type = finval::domain::parse_funding_source_type(*source_type)
                    .value_or(finval::domain::FundingSourceType::kCard);

  std::optional<std::string> account_number;
  if (source.type == finval::domain::FundingSourceType::kCard) {
    account_number = prompt_until_valid(in, out, "Card number", field_check(Field::kCardNumber));
  } else {
    source.routing_number =
        prompt_until_valid(in, out, "Routing number", field_check(Field::kRoutingNumber));
    if (source.routing_number.has_value()) {
      account_number = prompt_until_valid(in, out, "Bank account number",
                                          [](std::optional<std::string_view> raw) {
                                            return finval::app::validate_bank_account_number(
                                                raw.value_or(std::string_view{}));
                                          });
    }
  }
  if (!account_number.has_value()) {
    std::cerr << "Funding cancelled: input ended\n";
    return 1;
  }
  source.account_number = *account_number;

  const finval::app::FundingRequest request{
      .user_id = finval::core::UserId{user_id},
      .account_id = finval::core::AccountId{account_id},
      .amount = *amount,
      .source = source,
      .trace_id = std::nullopt,
  };
  try {
    auto outcome = finval::app::run_fund_account(request, services, id_gen, clock);
    if (!outcome.has_value()) {
      std::cerr << "Funding failed: " << outcome.error().message << "\n";
      return 1;
    }

    const auto& funded = outcome.value();
    out << "Deposited $" << funded.amount.formatted << " (" << funded.transaction.description
        << ")\n";
    out << "New balance: $" << finval::validation::format_cents(funded.new_balance_cents)
        << "\n";
    out << "Transaction: " << funded.transaction.transaction_id.value << " (trace "
        << funded.trace_id << ")\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: funding failed: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

int execute_list_transactions(const std::string& user_id, const std::string& account_id,
                              std::ostream& out, finval::core::Services& services) {
  nlohmann::json listing;
  try {
    auto outcome = finval::app::list_transactions(finval::core::UserId{user_id},
                                                  finval::core::AccountId{account_id}, services);
    if (!outcome.has_value()) {
      std::cerr << outcome.error().message << "\n";
      return 1;
    }

    listing["account_id"] = account_id;
    listing["transactions"] = nlohmann::json::array();
    for (const auto& view : outcome.value()) {
      auto entry = finval::domain::transaction_to_json(view.transaction);
      entry["account_type"] = std::string{finval::domain::account_type_name(view.account_type)};
      listing["transactions"].push_back(entry);
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: listing transactions failed: " << e.what() << "\n";
    return 1;
  }
  out << listing.dump(2) << "\n";
  return 0;
}
