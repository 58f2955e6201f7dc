#include "finval/core/version.h"

#include "commands/account.h"
#include "commands/signup.h"
#include "commands/validate.h"
#include <iostream>
#include <string>
#include <unordered_map>

namespace {

using Command = int (*)(int, char**);

void print_usage() {
  std::cerr << "finval_cli v" << finval::core::kBuildVersion << "\n"
            << "Usage: finval_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  validate <field> [<value>]  Validate one field (amount, card_number,\n"
            << "                              routing_number, phone_number, password, state)\n"
            << "  states                      List accepted state codes\n"
            << "  signup                      Interactive signup\n"
            << "  create-account              Open a checking or savings account\n"
            << "  accounts                    List a user's accounts\n"
            << "  fund                        Interactive deposit from a card or bank\n"
            << "  transactions                List an account's transactions\n\n"
            << "Storage options: --db <path> (default: in-memory), --deterministic\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::unordered_map<std::string, Command> commands = {
      {"validate", cmd_validate},
      {"states", cmd_states},
      {"signup", cmd_signup},
      {"create-account", cmd_create_account},
      {"accounts", cmd_list_accounts},
      {"fund", cmd_fund},
      {"transactions", cmd_transactions},
  };

  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "--help" || subcommand == "help") {
    print_usage();
    return 0;
  }

  const auto it = commands.find(subcommand);
  if (it == commands.end()) {
    std::cerr << "Unknown command: " << subcommand << "\n";
    print_usage();
    return 1;
  }
  return it->second(argc, argv);
}
