#include "fund_account.h"

#include "finval/app/app_service.h"
#include "finval/domain/domain_json.h"
#include "finval/validation/amount.h"
#include "request_parsing.h"

#include <exception>
#include <stdexcept>
#include <string>

namespace finval::server::handlers {

using json = nlohmann::json;

json handle_fund_account(const json& params, ServerContext& ctx) {
  try {
    if (!params.contains("amount")) {
      throw std::invalid_argument("Missing required parameter: amount");
    }
    if (!params.contains("funding_source")) {
      throw std::invalid_argument("Missing required parameter: funding_source");
    }

    app::FundingRequest request{
        .user_id = core::UserId{required_string(params, "user_id")},
        .account_id = core::AccountId{required_string(params, "account_id")},
        .amount = amount_from_json(params["amount"]),
        .source = funding_source_from_json(params["funding_source"]),
        .trace_id = trace_id_or_new(params, ctx.id_gen),
    };

    auto outcome = app::run_fund_account(request, ctx.services, ctx.id_gen, ctx.clock);
    if (!outcome.has_value()) {
      return flow_failure_result(*request.trace_id, outcome.error());
    }

    const auto& funded = outcome.value();
    json result;
    result["trace_id"] = funded.trace_id;
    result["transaction"] = domain::transaction_to_json(funded.transaction);
    result["amount"] = funded.amount.formatted;
    result["new_balance"] = validation::format_cents(funded.new_balance_cents);
    result["new_balance_cents"] = funded.new_balance_cents;
    return result;

  } catch (const std::exception& e) {
    json error_result;
    error_result["error"] = e.what();
    return error_result;
  }
}

}  // namespace finval::server::handlers
