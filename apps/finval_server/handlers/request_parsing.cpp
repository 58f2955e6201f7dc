#include "request_parsing.h"

#include "finval/app/finding_json.h"
#include "finval/core/ids.h"

#include <stdexcept>

namespace finval::server::handlers {

using json = nlohmann::json;

std::string required_string(const json& params, const std::string& key) {
  if (!params.contains(key) || params[key].is_null()) {
    throw std::invalid_argument("Missing required parameter: " + key);
  }
  if (!params[key].is_string()) {
    throw std::invalid_argument("Parameter '" + key + "' must be a string");
  }
  return params[key].get<std::string>();
}

std::optional<std::string> optional_string(const json& params, const std::string& key) {
  if (!params.contains(key) || params[key].is_null()) {
    return std::nullopt;
  }
  if (!params[key].is_string()) {
    throw std::invalid_argument("Parameter '" + key + "' must be a string");
  }
  return params[key].get<std::string>();
}

validation::AmountInput amount_from_json(const json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  // is_number() is false for booleans in nlohmann::json.
  if (value.is_number()) {
    return value.get<double>();
  }
  throw std::invalid_argument("amount must be a string or a number");
}

domain::FundingSource funding_source_from_json(const json& value) {
  if (!value.is_object()) {
    throw std::invalid_argument("funding_source must be an object");
  }
  const std::string type_name = required_string(value, "type");
  const auto type = domain::parse_funding_source_type(type_name);
  if (!type.has_value()) {
    throw std::invalid_argument("Unsupported funding source type: " + type_name);
  }

  domain::FundingSource source;
  source.type = *type;
  source.account_number = optional_string(value, "account_number").value_or("");
  source.routing_number = optional_string(value, "routing_number");
  return source;
}

std::string trace_id_or_new(const json& params, core::IIdGenerator& id_gen) {
  auto trace_id = optional_string(params, "trace_id");
  if (trace_id.has_value() && !trace_id->empty()) {
    return *trace_id;
  }
  return core::new_trace_id(id_gen).value;
}

json flow_failure_result(const std::string& trace_id, const app::FlowFailure& failure) {
  json result;
  result["trace_id"] = trace_id;
  result["error"] = failure.message;
  result["failure"] = app::failure_to_json(failure);
  return result;
}

}  // namespace finval::server::handlers
