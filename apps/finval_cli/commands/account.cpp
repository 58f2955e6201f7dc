#include "account.h"

#include "account_logic.h"
#include "runtime.h"
#include <iostream>
#include <optional>
#include <string>

namespace {

bool require(const std::optional<std::string>& value, const char* flag) {
  if (!value.has_value()) {
    std::cerr << "Error: " << flag << " is required\n";
    return false;
  }
  return true;
}

}  // namespace

int cmd_create_account(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto config = parse_cli_config(argc, argv);
  if (!config.has_value() || !require(config->user_id, "--user-id <id>") ||
      !require(config->account_type, "--type checking|savings")) {
    return 1;
  }
  auto runtime = open_runtime(*config);
  if (!runtime) {
    return 1;
  }
  return execute_create_account(*config->user_id, *config->account_type, std::cout,
                                runtime->backend->services(), *runtime->id_gen, *runtime->clock);
}

int cmd_list_accounts(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto config = parse_cli_config(argc, argv);
  if (!config.has_value() || !require(config->user_id, "--user-id <id>")) {
    return 1;
  }
  auto runtime = open_runtime(*config);
  if (!runtime) {
    return 1;
  }
  return execute_list_accounts(*config->user_id, std::cout, runtime->backend->services());
}

int cmd_fund(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto config = parse_cli_config(argc, argv);
  if (!config.has_value() || !require(config->user_id, "--user-id <id>") ||
      !require(config->account_id, "--account-id <id>")) {
    return 1;
  }
  auto runtime = open_runtime(*config);
  if (!runtime) {
    return 1;
  }
  return execute_fund(std::cin, std::cout, *config->user_id, *config->account_id,
                      runtime->backend->services(), *runtime->id_gen, *runtime->clock);
}

int cmd_transactions(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto config = parse_cli_config(argc, argv);
  if (!config.has_value() || !require(config->user_id, "--user-id <id>") ||
      !require(config->account_id, "--account-id <id>")) {
    return 1;
  }
  auto runtime = open_runtime(*config);
  if (!runtime) {
    return 1;
  }
  return execute_list_transactions(*config->user_id, *config->account_id, std::cout,
                                   runtime->backend->services());
}
