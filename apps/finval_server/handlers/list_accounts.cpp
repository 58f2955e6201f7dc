#include "list_accounts.h"

#include "finval/app/app_service.h"
#include "finval/domain/domain_json.h"
#include "request_parsing.h"

#include <exception>
#include <string>

namespace finval::server::handlers {

using json = nlohmann::json;

json handle_list_accounts(const json& params, ServerContext& ctx) {
  try {
    const core::UserId user_id{required_string(params, "user_id")};

    json result;
    result["user_id"] = user_id.value;
    result["accounts"] = json::array();
    for (const auto& account : app::list_accounts(user_id, ctx.services)) {
      result["accounts"].push_back(domain::account_to_json(account));
    }
    return result;

  } catch (const std::exception& e) {
    json error_result;
    error_result["error"] = e.what();
    return error_result;
  }
}

}  // namespace finval::server::handlers
