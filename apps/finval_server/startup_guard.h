#pragma once

#include "config.h"

#include <string>

namespace finval::server {

// validate_server_config checks startup preconditions.
// Returns "" on success, otherwise the message to print before exiting with 1.
//
// Checked:
// - --audit-chain-verify warn|fail needs --db (an in-memory log has no history to verify)
[[nodiscard]] std::string validate_server_config(const ServerConfig& config);

}  // namespace finval::server
