#include "runtime.h"

#include <iostream>
#include <utility>

namespace {

// 2026-01-01T00:00:00Z
constexpr long long kDeterministicEpoch = 1767225600;

bool set_string(std::optional<std::string>& slot, const std::string& value) {
  if (value.empty()) {
    return false;
  }
  slot = value;
  return true;
}

}  // namespace

std::vector<finval::apps::Option<CliConfig>> cli_options() {
  return {
      {"--db", true, "Path to SQLite database file (default: in-memory)",
       [](CliConfig& c, const std::string& v) { return set_string(c.db_path, v); }},
      {"--deterministic", false, "Sequential IDs, a stepping clock and a fixed salt",
       [](CliConfig& c, const std::string& /*v*/) {
         c.deterministic = true;
         return true;
       }},
      {"--user-id", true, "User the command acts for",
       [](CliConfig& c, const std::string& v) { return set_string(c.user_id, v); }},
      {"--account-id", true, "Account the command acts on",
       [](CliConfig& c, const std::string& v) { return set_string(c.account_id, v); }},
      {"--type", true, "Account type (checking|savings)",
       [](CliConfig& c, const std::string& v) { return set_string(c.account_type, v); }},
  };
}

std::optional<CliConfig> parse_cli_config(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = cli_options();
  auto parsed = finval::apps::parse_options(argc, argv, options, 2);
  for (const auto& positional : parsed.positionals) {
    parsed.errors.push_back("Unexpected argument: " + positional);
  }
  if (!parsed.ok()) {
    for (const auto& error : parsed.errors) {
      std::cerr << "Error: " << error << "\n";
    }
    for (const auto& line : finval::apps::usage_lines(options)) {
      std::cerr << line << "\n";
    }
    return std::nullopt;
  }
  return std::move(parsed.config);
}

std::unique_ptr<CliRuntime> open_runtime(const CliConfig& config) {
  if (config.db_path.has_value()) {
    std::cerr << "Storage: SQLite -- " << config.db_path.value() << "\n";
  } else {
    std::cerr << "WARNING: No --db path specified. Data entered now is LOST on exit.\n";
  }

  auto backend = finval::app::Backend::open(config.db_path);
  if (!backend.has_value()) {
    std::cerr << "Failed to open storage: " << backend.error() << "\n";
    return nullptr;
  }

  auto runtime = std::make_unique<CliRuntime>();
  runtime->backend = backend.value();
  if (config.deterministic) {
    runtime->id_gen = std::make_unique<finval::core::DeterministicIdGenerator>();
    runtime->clock = std::make_unique<finval::core::SteppingClock>(kDeterministicEpoch);
    runtime->salts = std::make_unique<finval::core::FixedSaltSource>("finval-deterministic-salt");
  } else {
    runtime->id_gen = std::make_unique<finval::core::SystemIdGenerator>();
    runtime->clock = std::make_unique<finval::core::SystemClock>();
    runtime->salts = std::make_unique<finval::core::RandomSaltSource>();
  }
  return runtime;
}
