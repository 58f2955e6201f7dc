#include <catch2/catch_test_macros.hpp>

#include "finval/core/clock.h"
#include "finval/core/id_generator.h"
#include "finval/core/password_hash.h"
#include "finval/core/services.h"
#include "finval/storage/audit_chain.h"
#include "finval/storage/audit_log.h"
#include "finval/storage/inmemory_account_repository.h"
#include "finval/storage/inmemory_user_repository.h"

#include "config.h"
#include "rpc_protocol.h"
#include "server_context.h"
#include "server_loop.h"

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>

using namespace finval;
using nlohmann::json;

namespace {

struct ServerFixture {
  storage::InMemoryUserRepository users;
  storage::InMemoryAccountRepository accounts;
  storage::InMemoryAuditLog audit_log;
  core::Services services{users, accounts, audit_log};
  core::DeterministicIdGenerator id_gen;
  core::SteppingClock clock{1767225600};
  core::FixedSaltSource salts{"testsalt"};
  server::ServerConfig config;
  server::ServerContext ctx{services, id_gen, clock, salts, config};

  json call(const json& request) { return json::parse(server::handle_line(request.dump(), ctx)); }

  // Result object of a tools/call request.
  json tool(const std::string& name, const json& arguments) {
    const json response = call({{"jsonrpc", "2.0"},
                                {"id", 1},
                                {"method", "tools/call"},
                                {"params", {{"name", name}, {"arguments", arguments}}}});
    REQUIRE(response.contains("result"));
    return response["result"];
  }
};

json signup_arguments() {
  return {{"email", "Casey@Example.com"},    {"password", "Password1!"},
          {"first_name", "Casey"},           {"last_name", "Jordan"},
          {"phone_number", "202-555-0143"},  {"date_of_birth", "1992-03-04"},
          {"address", "9 Elm St"},           {"city", "Denver"},
          {"state", "co"},                   {"zip_code", "80202"}};
}

}  // namespace

// ── protocol ────────────────────────────────────────────────────────────────

TEST_CASE("parse_request: keeps string and numeric ids", "[rpc]") {
  const auto numeric = server::parse_request(R"({"jsonrpc":"2.0","id":7,"method":"initialize"})");
  REQUIRE(numeric.has_value());
  CHECK(numeric->id == 7);
  CHECK(numeric->method == "initialize");

  const auto text = server::parse_request(R"({"id":"abc","method":"tools/list"})");
  REQUIRE(text.has_value());
  CHECK(text->id == "abc");

  CHECK_FALSE(server::parse_request("not json").has_value());
  CHECK_FALSE(server::parse_request("[1,2,3]").has_value());
}

TEST_CASE("handle_line: invalid JSON is a parse error with null id", "[rpc]") {
  ServerFixture f;
  const json response = json::parse(server::handle_line("{oops", f.ctx));
  CHECK(response["id"].is_null());
  CHECK(response["error"]["code"] == server::kParseError);
}

TEST_CASE("handle_line: missing and unknown methods", "[rpc]") {
  ServerFixture f;

  const json missing = f.call({{"jsonrpc", "2.0"}, {"id", 2}});
  CHECK(missing["error"]["code"] == server::kInvalidRequest);
  CHECK(missing["id"] == 2);

  const json unknown = f.call({{"jsonrpc", "2.0"}, {"id", "x"}, {"method", "resources/list"}});
  CHECK(unknown["error"]["code"] == server::kMethodNotFound);
  CHECK(unknown["error"]["message"] == "Unknown method: resources/list");
  CHECK(unknown["id"] == "x");
}

TEST_CASE("initialize and tools/list", "[rpc]") {
  ServerFixture f;

  const json init = f.call({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}});
  CHECK(init["result"]["serverInfo"]["name"] == "finval");
  CHECK(init["result"]["protocolVersion"] == "2024-11-05");

  const json list = f.call({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
  const auto& tools = list["result"]["tools"];
  REQUIRE(tools.size() == 8);
  for (const auto& tool : tools) {
    CHECK(tool.contains("name"));
    CHECK(tool.contains("inputSchema"));
  }
}

TEST_CASE("tools/call: unknown tool", "[rpc]") {
  ServerFixture f;
  const json result = f.tool("transfer_funds", json::object());
  CHECK(result["error"] == "Unknown tool: transfer_funds");
}

// ── validate_field ──────────────────────────────────────────────────────────

TEST_CASE("validate_field tool", "[rpc][validate]") {
  ServerFixture f;

  SECTION("valid card reports its network") {
    const json result = f.tool("validate_field", {{"field", "card_number"},
                                                  {"value", "4111111111111111"}});
    CHECK(result["valid"] == true);
    CHECK(result["normalized"] == "Visa");
  }

  SECTION("numeric amount is normalized") {
    const json result = f.tool("validate_field", {{"field", "amount"}, {"value", 12.5}});
    CHECK(result["valid"] == true);
    CHECK(result["normalized"] == "12.50");
  }

  SECTION("rejection carries code and message") {
    const json result = f.tool("validate_field", {{"field", "state"}, {"value", "XX"}});
    CHECK(result["valid"] == false);
    CHECK(result.contains("error_code"));
    CHECK(result.contains("error_message"));
  }

  SECTION("absent value is required") {
    const json result = f.tool("validate_field", {{"field", "routing_number"}});
    CHECK(result["valid"] == false);
    CHECK(result["error_code"] == "REQUIRED");
  }

  SECTION("boolean value is a type error") {
    const json result = f.tool("validate_field", {{"field", "amount"}, {"value", true}});
    CHECK(result["error"] == "Parameter 'value' must be a string");
  }

  SECTION("unknown field") {
    const json result = f.tool("validate_field", {{"field", "ssn"}, {"value", "1"}});
    CHECK(result["error"] == "Unknown field: ssn");
  }
}

TEST_CASE("list_state_codes tool", "[rpc]") {
  ServerFixture f;
  const json result = f.tool("list_state_codes", json::object());
  CHECK(result["codes"].size() == 56);
  CHECK(result["states"].size() == 50);
  CHECK(result["territories"].size() == 5);
}

// ── end-to-end ──────────────────────────────────────────────────────────────

TEST_CASE("signup, create_account, fund_account, list, audit", "[rpc][flow]") {
  ServerFixture f;

  const json signup = f.tool("signup", signup_arguments());
  REQUIRE(signup.contains("user"));
  CHECK(signup["user"]["email"] == "casey@example.com");
  CHECK(signup["user"]["phone_number"] == "+12025550143");
  CHECK(signup["user"]["state"] == "CO");
  CHECK_FALSE(signup["user"].contains("password_hash"));
  const auto user_id = signup["user"]["user_id"].get<std::string>();

  const json created =
      f.tool("create_account", {{"user_id", user_id}, {"account_type", "checking"}});
  REQUIRE(created.contains("account"));
  CHECK(created["account"]["balance"] == "0.00");
  const auto account_id = created["account"]["account_id"].get<std::string>();

  const json accounts = f.tool("list_accounts", {{"user_id", user_id}});
  CHECK(accounts["accounts"].size() == 1);

  const json funded = f.tool(
      "fund_account",
      {{"user_id", user_id},
       {"account_id", account_id},
       {"amount", "250"},
       {"funding_source", {{"type", "card"}, {"account_number", "5555555555554444"}}},
       {"trace_id", "trace-fund-1"}});
  REQUIRE(funded.contains("transaction"));
  CHECK(funded["trace_id"] == "trace-fund-1");
  CHECK(funded["amount"] == "250.00");
  CHECK(funded["new_balance"] == "250.00");
  CHECK(funded["new_balance_cents"] == 25000);
  CHECK(funded["transaction"]["description"] == "Funding from card");

  const json listed =
      f.tool("list_transactions", {{"user_id", user_id}, {"account_id", account_id}});
  REQUIRE(listed["transactions"].size() == 1);
  CHECK(listed["transactions"][0]["account_type"] == "checking");

  const json trace = f.tool("get_audit_trace", {{"trace_id", "trace-fund-1"}});
  REQUIRE(trace["events"].size() == 1);
  CHECK(trace["events"][0]["event_type"] == "AccountFunded");
  CHECK(trace["events"][0]["payload"]["amount_cents"] == 25000);
  CHECK(trace["events"][0]["previous_hash"] == std::string{storage::kGenesisHash});

  CHECK(storage::find_broken_traces(f.audit_log).empty());
}

TEST_CASE("fund_account tool: rejected input carries trace and findings", "[rpc][flow]") {
  ServerFixture f;
  const json signup = f.tool("signup", signup_arguments());
  const auto user_id = signup["user"]["user_id"].get<std::string>();
  const json created =
      f.tool("create_account", {{"user_id", user_id}, {"account_type", "savings"}});
  const auto account_id = created["account"]["account_id"].get<std::string>();

  const json rejected =
      f.tool("fund_account", {{"user_id", user_id},
                              {"account_id", account_id},
                              {"amount", "00.50"},
                              {"funding_source", {{"type", "bank"}, {"account_number", "123"}}}});
  CHECK(rejected.contains("trace_id"));
  CHECK(rejected["failure"]["kind"] == "validation");
  REQUIRE(rejected["failure"]["findings"].size() == 3);
  CHECK(rejected["failure"]["findings"][0]["error_code"] == "LEADING_ZERO");
  CHECK(rejected["failure"]["findings"][1]["error_code"] == "REQUIRED");
  CHECK(rejected["failure"]["findings"][2]["valid"] == true);

  const auto trace_id = rejected["trace_id"].get<std::string>();
  const json trace = f.tool("get_audit_trace", {{"trace_id", trace_id}});
  REQUIRE(trace["events"].size() == 1);
  CHECK(trace["events"][0]["event_type"] == "FundingRejected");
}

TEST_CASE("request parsing errors surface as tool errors", "[rpc]") {
  ServerFixture f;

  CHECK(f.tool("create_account", {{"user_id", "user-1"}, {"account_type", "brokerage"}})["error"] ==
        "Invalid account type: brokerage");
  CHECK(f.tool("list_accounts", json::object())["error"] ==
        "Missing required parameter: user_id");
  CHECK(f.tool("fund_account", {{"user_id", "u"},
                                {"account_id", "a"},
                                {"amount", json::array()},
                                {"funding_source", {{"type", "card"}}}})["error"] ==
        "amount must be a string or a number");
  CHECK(f.tool("fund_account", {{"user_id", "u"},
                                {"account_id", "a"},
                                {"amount", "1"},
                                {"funding_source", {{"type", "crypto"}}}})["error"] ==
        "Unsupported funding source type: crypto");
  CHECK(f.tool("list_transactions", {{"user_id", "u"}, {"account_id", "a"}})["error"] ==
        "Account not found");
}

// ── server loop ─────────────────────────────────────────────────────────────

TEST_CASE("run_server_loop: one response per non-blank line", "[rpc]") {
  ServerFixture f;
  std::istringstream in(
      "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}\n"
      "\n"
      "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n");
  std::ostringstream out;

  server::run_server_loop(f.ctx, in, out);

  std::istringstream lines(out.str());
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    const json response = json::parse(line);
    CHECK(response["id"] == ++count);
  }
  CHECK(count == 2);
}
