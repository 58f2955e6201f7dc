#pragma once

#include "finval/app/backend.h"
#include "finval/core/clock.h"
#include "finval/core/id_generator.h"
#include "finval/core/password_hash.h"
#include "finval/core/services.h"

#include "shared/arg_parser.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Flags shared by every finval_cli subcommand that touches storage.
struct CliConfig {
  std::optional<std::string> db_path;       // NOLINT(readability-identifier-naming)
  bool deterministic{false};                // NOLINT(readability-identifier-naming)
  std::optional<std::string> user_id;       // NOLINT(readability-identifier-naming)
  std::optional<std::string> account_id;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> account_type;  // NOLINT(readability-identifier-naming)
};

std::vector<finval::apps::Option<CliConfig>> cli_options();

// parse_cli_config parses argv[2..]. Prints errors and returns std::nullopt on failure.
std::optional<CliConfig> parse_cli_config(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// CliRuntime owns the storage backend and the generators for one command run.
struct CliRuntime {
  std::shared_ptr<finval::app::Backend> backend;       // NOLINT(readability-identifier-naming)
  std::unique_ptr<finval::core::IIdGenerator> id_gen;  // NOLINT(readability-identifier-naming)
  std::unique_ptr<finval::core::IClock> clock;         // NOLINT(readability-identifier-naming)
  std::unique_ptr<finval::core::ISaltSource> salts;    // NOLINT(readability-identifier-naming)
};

// open_runtime announces the storage mode on stderr. Prints the error and returns
// nullptr when the database cannot be opened.
std::unique_ptr<CliRuntime> open_runtime(const CliConfig& config);
