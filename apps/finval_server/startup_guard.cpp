#include "startup_guard.h"

namespace finval::server {

std::string validate_server_config(const ServerConfig& config) {
  if (config.audit_chain_verify != AuditChainVerifyMode::kOff && !config.db_path.has_value()) {
    return "Error: --audit-chain-verify warn|fail requires --db <path>.\n"
           "       An in-memory audit log starts empty; there is no chain to verify.";
  }
  return "";
}

}  // namespace finval::server
