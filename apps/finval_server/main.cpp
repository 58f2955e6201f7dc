#include "finval/app/backend.h"
#include "finval/core/clock.h"
#include "finval/core/id_generator.h"
#include "finval/core/password_hash.h"
#include "finval/core/version.h"
#include "finval/storage/audit_chain.h"

#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace finval;

namespace {

// 2026-01-01T00:00:00Z
constexpr long long kDeterministicEpoch = 1767225600;

void print_usage() {
  std::cerr << "Usage: finval_server [options]\n";
  for (const auto& line : apps::usage_lines(server::server_options())) {
    std::cerr << line << "\n";
  }
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  auto parsed = server::parse_args(argc, argv);
  for (const auto& positional : parsed.positionals) {
    parsed.errors.push_back("Unexpected argument: " + positional);
  }
  if (!parsed.ok()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    print_usage();
    return 1;
  }
  const server::ServerConfig& config = parsed.config;

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = server::validate_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // ── Startup diagnostic block ──────────────────────────────────────────────
  std::cerr << "finval JSON-RPC Server v" << core::kBuildVersion << "\n";

  if (config.db_path.has_value()) {
    std::cerr << "Storage:     SQLite -- " << config.db_path.value() << "\n";
  } else {
    std::cerr << "WARNING: No --db path specified. Running with EPHEMERAL in-memory storage.\n"
                 "         All users, accounts, transactions and the audit log\n"
                 "         will be LOST on process exit. Pass --db <path> to enable persistence.\n";
  }
  if (config.deterministic) {
    std::cerr << "Mode:        deterministic (sequential IDs, stepping clock, fixed salt)\n";
  }

  auto backend_result = app::Backend::open(config.db_path);
  if (!backend_result.has_value()) {
    std::cerr << "Failed to open storage: " << backend_result.error() << "\n";
    return 1;
  }
  app::Backend& backend = *backend_result.value();

  if (config.audit_chain_verify != server::AuditChainVerifyMode::kOff) {
    std::vector<storage::BrokenTrace> broken;
    try {
      broken = storage::find_broken_traces(backend.services().audit_log);
    } catch (const std::exception& e) {
      std::cerr << "Audit chain verification failed: " << e.what() << "\n";
      return 1;
    }
    for (const auto& trace : broken) {
      std::cerr << "Audit chain broken: trace " << trace.trace_id << " at event "
                << trace.check.broken_at << " (" << trace.check.reason << ")\n";
    }
    if (!broken.empty() && config.audit_chain_verify == server::AuditChainVerifyMode::kFail) {
      std::cerr << "Refusing to start: " << broken.size() << " broken audit trace(s)\n";
      return 1;
    }
    std::cerr << "Audit chain: " << (broken.empty() ? "intact" : "BROKEN (continuing)") << "\n";
  }

  std::cerr << "Listening on stdio for JSON-RPC requests...\n";
  // ─────────────────────────────────────────────────────────────────────────

  std::unique_ptr<core::IIdGenerator> id_gen;
  std::unique_ptr<core::IClock> clock;
  std::unique_ptr<core::ISaltSource> salts;
  if (config.deterministic) {
    id_gen = std::make_unique<core::DeterministicIdGenerator>();
    clock = std::make_unique<core::SteppingClock>(kDeterministicEpoch);
    salts = std::make_unique<core::FixedSaltSource>("finval-deterministic-salt");
  } else {
    id_gen = std::make_unique<core::SystemIdGenerator>();
    clock = std::make_unique<core::SystemClock>();
    salts = std::make_unique<core::RandomSaltSource>();
  }

  server::ServerContext ctx{backend.services(), *id_gen, *clock, *salts, config};
  server::run_server_loop(ctx, std::cin, std::cout);

  return 0;
}
