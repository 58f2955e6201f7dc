#include "create_account.h"

#include "finval/app/app_service.h"
#include "finval/domain/account.h"
#include "finval/domain/domain_json.h"
#include "request_parsing.h"

#include <exception>
#include <stdexcept>
#include <string>

namespace finval::server::handlers {

using json = nlohmann::json;

json handle_create_account(const json& params, ServerContext& ctx) {
  try {
    const std::string type_name = required_string(params, "account_type");
    const auto account_type = domain::parse_account_type(type_name);
    if (!account_type.has_value()) {
      throw std::invalid_argument("Invalid account type: " + type_name);
    }

    app::CreateAccountRequest request{
        .user_id = core::UserId{required_string(params, "user_id")},
        .account_type = *account_type,
        .trace_id = trace_id_or_new(params, ctx.id_gen),
    };

    auto outcome = app::run_create_account(request, ctx.services, ctx.id_gen, ctx.clock);
    if (!outcome.has_value()) {
      return flow_failure_result(*request.trace_id, outcome.error());
    }

    json result;
    result["trace_id"] = outcome.value().trace_id;
    result["account"] = domain::account_to_json(outcome.value().account);
    return result;

  } catch (const std::exception& e) {
    json error_result;
    error_result["error"] = e.what();
    return error_result;
  }
}

}  // namespace finval::server::handlers
