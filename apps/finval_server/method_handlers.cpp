#include "method_handlers.h"

#include "finval/core/version.h"
#include "handlers/tool_registry.h"

namespace finval::server {

using json = nlohmann::json;

namespace {

json string_prop(const char* description) {
  return json{{"type", "string"}, {"description", description}};
}

json funding_source_schema() {
  return json{
      {"type", "object"},
      {"properties",
       {
           {"type", {{"type", "string"}, {"enum", json::array({"card", "bank"})}}},
           {"account_number", string_prop("Card number or bank account number")},
           {"routing_number", string_prop("ABA routing number (bank only)")},
       }},
      {"required", json::array({"type", "account_number"})},
  };
}

}  // namespace

json handle_initialize(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return json{
      {"protocolVersion", "2024-11-05"},
      {"capabilities", {{"tools", json::object()}}},
      {"serverInfo", {{"name", "finval"}, {"version", core::kBuildVersion}}},
  };
}

json handle_tools_list(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  json tools = json::array();

  tools.push_back({
      {"name", "validate_field"},
      {"description", "Validate and normalize one input field"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties",
            {
                {"field",
                 {{"type", "string"},
                  {"enum", json::array({"amount", "card_number", "routing_number",
                                        "phone_number", "password", "state"})}}},
                {"value", {{"type", json::array({"string", "number"})}}},
            }},
           {"required", json::array({"field"})},
       }},
  });

  json signup_props = json::object();
  for (const char* key : {"email", "password", "first_name", "last_name", "phone_number",
                          "date_of_birth", "address", "city", "state", "zip_code", "trace_id"}) {
    signup_props[key] = {{"type", "string"}};
  }
  tools.push_back({
      {"name", "signup"},
      {"description", "Validate every signup field and create the user when all pass"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties", signup_props},
           {"required", json::array({"email", "password", "first_name", "last_name",
                                     "phone_number", "date_of_birth", "address", "city",
                                     "state", "zip_code"})},
       }},
  });

  tools.push_back({
      {"name", "create_account"},
      {"description", "Open a checking or savings account for a user"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties",
            {
                {"user_id", {{"type", "string"}}},
                {"account_type",
                 {{"type", "string"}, {"enum", json::array({"checking", "savings"})}}},
                {"trace_id", {{"type", "string"}}},
            }},
           {"required", json::array({"user_id", "account_type"})},
       }},
  });

  tools.push_back({
      {"name", "list_accounts"},
      {"description", "List a user's accounts"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties", {{"user_id", {{"type", "string"}}}}},
           {"required", json::array({"user_id"})},
       }},
  });

  tools.push_back({
      {"name", "fund_account"},
      {"description", "Deposit into an account from a card or bank funding source"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties",
            {
                {"user_id", {{"type", "string"}}},
                {"account_id", {{"type", "string"}}},
                {"amount", {{"type", json::array({"string", "number"})}}},
                {"funding_source", funding_source_schema()},
                {"trace_id", {{"type", "string"}}},
            }},
           {"required", json::array({"user_id", "account_id", "amount", "funding_source"})},
       }},
  });

  tools.push_back({
      {"name", "list_transactions"},
      {"description", "List an account's transactions, newest first"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties",
            {
                {"user_id", {{"type", "string"}}},
                {"account_id", {{"type", "string"}}},
            }},
           {"required", json::array({"user_id", "account_id"})},
       }},
  });

  tools.push_back({
      {"name", "get_audit_trace"},
      {"description", "Fetch audit events by trace_id"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties", {{"trace_id", {{"type", "string"}}}}},
           {"required", json::array({"trace_id"})},
       }},
  });

  tools.push_back({
      {"name", "list_state_codes"},
      {"description", "Accepted state codes grouped by category"},
      {"inputSchema", {{"type", "object"}, {"properties", json::object()}}},
  });

  return json{{"tools", tools}};
}

json handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx) {
  std::string tool_name = req.params.value("name", "");
  json tool_params = req.params.value("arguments", json::object());

  static auto tool_registry = handlers::build_tool_registry();

  auto it = tool_registry.find(tool_name);
  if (it == tool_registry.end()) {
    json error_result;
    error_result["error"] = "Unknown tool: " + tool_name;
    return error_result;
  }

  return it->second(tool_params, ctx);
}

std::unordered_map<std::string, MethodHandler> build_method_registry() {
  return {
      {"initialize", handle_initialize},
      {"tools/list", handle_tools_list},
      {"tools/call", handle_tools_call},
  };
}

}  // namespace finval::server
