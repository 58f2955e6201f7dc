#pragma once

#include "shared/arg_parser.h"

#include <optional>
#include <string>
#include <vector>

namespace finval::server {

// AuditChainVerifyMode controls startup-time hash-chain verification.
// kOff  no verification (default)
// kWarn verify every trace; report broken traces on stderr and continue
// kFail verify every trace; refuse to start if any trace is broken
enum class AuditChainVerifyMode {
  kOff,   // NOLINT(readability-identifier-naming)
  kWarn,  // NOLINT(readability-identifier-naming)
  kFail,  // NOLINT(readability-identifier-naming)
};

struct ServerConfig {
  std::optional<std::string> db_path;  // NOLINT(readability-identifier-naming)
  AuditChainVerifyMode audit_chain_verify{  // NOLINT(readability-identifier-naming)
                                          AuditChainVerifyMode::kOff};
  // Sequential IDs, a stepping clock and a fixed salt for reproducible runs.
  bool deterministic{false};  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::vector<apps::Option<ServerConfig>> server_options();

[[nodiscard]] apps::ParsedOptions<ServerConfig> parse_args(
    int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

}  // namespace finval::server
