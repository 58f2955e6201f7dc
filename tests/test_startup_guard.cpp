#include <catch2/catch_test_macros.hpp>

#include "config.h"
#include "startup_guard.h"

#include <string>

using namespace finval::server;

// ── audit chain verification needs a database ───────────────────────────────

TEST_CASE("validate_server_config: warn without --db returns error", "[startup][config]") {
  ServerConfig config;
  config.audit_chain_verify = AuditChainVerifyMode::kWarn;

  const auto error = validate_server_config(config);
  CHECK_FALSE(error.empty());
  CHECK(error.find("--db") != std::string::npos);
}

TEST_CASE("validate_server_config: fail without --db returns error", "[startup][config]") {
  ServerConfig config;
  config.audit_chain_verify = AuditChainVerifyMode::kFail;

  CHECK_FALSE(validate_server_config(config).empty());
}

TEST_CASE("validate_server_config: fail with --db returns empty", "[startup][config]") {
  ServerConfig config;
  config.audit_chain_verify = AuditChainVerifyMode::kFail;
  config.db_path = "/tmp/finval.db";

  CHECK(validate_server_config(config).empty());
}

// ── defaults ────────────────────────────────────────────────────────────────

TEST_CASE("validate_server_config: default configuration is valid", "[startup][config]") {
  const ServerConfig config;
  CHECK(validate_server_config(config).empty());
  CHECK_FALSE(config.db_path.has_value());
  CHECK_FALSE(config.deterministic);
}
