#include "signup.h"

#include "finval/app/app_service.h"
#include "finval/domain/domain_json.h"
#include "request_parsing.h"

#include <exception>
#include <string>

namespace finval::server::handlers {

using json = nlohmann::json;

json handle_signup(const json& params, ServerContext& ctx) {
  try {
    app::SignupRequest request;
    request.email = optional_string(params, "email");
    request.password = optional_string(params, "password");
    request.first_name = optional_string(params, "first_name");
    request.last_name = optional_string(params, "last_name");
    request.phone_number = optional_string(params, "phone_number");
    request.date_of_birth = optional_string(params, "date_of_birth");
    request.address = optional_string(params, "address");
    request.city = optional_string(params, "city");
    request.state = optional_string(params, "state");
    request.zip_code = optional_string(params, "zip_code");
    request.trace_id = trace_id_or_new(params, ctx.id_gen);

    auto outcome = app::run_signup(request, ctx.services, ctx.id_gen, ctx.clock, ctx.salts);
    if (!outcome.has_value()) {
      return flow_failure_result(*request.trace_id, outcome.error());
    }

    json result;
    result["trace_id"] = outcome.value().trace_id;
    result["user"] = domain::user_to_json(outcome.value().user);
    return result;

  } catch (const std::exception& e) {
    json error_result;
    error_result["error"] = e.what();
    return error_result;
  }
}

}  // namespace finval::server::handlers
