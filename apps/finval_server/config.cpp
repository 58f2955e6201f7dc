#include "config.h"

namespace finval::server {

namespace {

bool handle_db(ServerConfig& config, const std::string& value) {
  if (value.empty()) {
    return false;
  }
  config.db_path = value;
  return true;
}

bool handle_audit_chain_verify(ServerConfig& config, const std::string& value) {
  if (value == "off") {
    config.audit_chain_verify = AuditChainVerifyMode::kOff;
  } else if (value == "warn") {
    config.audit_chain_verify = AuditChainVerifyMode::kWarn;
  } else if (value == "fail") {
    config.audit_chain_verify = AuditChainVerifyMode::kFail;
  } else {
    return false;
  }
  return true;
}

bool handle_deterministic(ServerConfig& config, const std::string& /*value*/) {
  config.deterministic = true;
  return true;
}

}  // namespace

std::vector<apps::Option<ServerConfig>> server_options() {
  return {
      {"--db", true, "Path to SQLite database file (default: in-memory)", handle_db},
      {"--audit-chain-verify", true, "Startup audit hash-chain check (off|warn|fail)",
       handle_audit_chain_verify},
      {"--deterministic", false, "Sequential IDs and a stepping clock", handle_deterministic},
  };
}

apps::ParsedOptions<ServerConfig> parse_args(int argc, char* argv[]) {
  return apps::parse_options(argc, argv, server_options());
}

}  // namespace finval::server
