#include "finval/domain/domain_json.h"

#include "finval/validation/amount.h"

namespace finval::domain {

nlohmann::json user_to_json(const User& user) {
  nlohmann::json j;
  j["user_id"] = user.user_id.value;
  j["email"] = user.email;
  j["first_name"] = user.first_name;
  j["last_name"] = user.last_name;
  j["phone_number"] = user.phone_number;
  j["date_of_birth"] = user.date_of_birth;
  j["address"] = user.address;
  j["city"] = user.city;
  j["state"] = user.state;
  j["zip_code"] = user.zip_code;
  j["created_at"] = user.created_at;
  return j;
}

nlohmann::json account_to_json(const Account& account) {
  nlohmann::json j;
  j["account_id"] = account.account_id.value;
  j["user_id"] = account.user_id.value;
  j["account_number"] = account.account_number;
  j["account_type"] = std::string{account_type_name(account.type)};
  j["balance_cents"] = account.balance_cents;
  j["balance"] = validation::format_cents(account.balance_cents);
  j["status"] = std::string{account_status_name(account.status)};
  j["created_at"] = account.created_at;
  return j;
}

nlohmann::json transaction_to_json(const Transaction& transaction) {
  nlohmann::json j;
  j["transaction_id"] = transaction.transaction_id.value;
  j["account_id"] = transaction.account_id.value;
  j["type"] = transaction.type;
  j["amount_cents"] = transaction.amount_cents;
  j["amount"] = validation::format_cents(transaction.amount_cents);
  j["description"] = transaction.description;
  j["status"] = transaction.status;
  j["processed_at"] = transaction.processed_at;
  return j;
}

}  // namespace finval::domain
