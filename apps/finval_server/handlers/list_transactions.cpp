#include "list_transactions.h"

#include "finval/app/app_service.h"
#include "finval/domain/account.h"
#include "finval/domain/domain_json.h"
#include "request_parsing.h"

#include <exception>
#include <string>

namespace finval::server::handlers {

using json = nlohmann::json;

json handle_list_transactions(const json& params, ServerContext& ctx) {
  try {
    const core::UserId user_id{required_string(params, "user_id")};
    const core::AccountId account_id{required_string(params, "account_id")};

    auto outcome = app::list_transactions(user_id, account_id, ctx.services);
    if (!outcome.has_value()) {
      json error_result;
      error_result["error"] = outcome.error().message;
      return error_result;
    }

    json result;
    result["account_id"] = account_id.value;
    result["transactions"] = json::array();
    for (const auto& view : outcome.value()) {
      json entry = domain::transaction_to_json(view.transaction);
      entry["account_type"] = std::string{domain::account_type_name(view.account_type)};
      result["transactions"].push_back(entry);
    }
    return result;

  } catch (const std::exception& e) {
    json error_result;
    error_result["error"] = e.what();
    return error_result;
  }
}

}  // namespace finval::server::handlers
