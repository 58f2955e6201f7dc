#include "signup.h"

#include "runtime.h"
#include "signup_logic.h"
#include <iostream>

int cmd_signup(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto config = parse_cli_config(argc, argv);
  if (!config.has_value()) {
    return 1;
  }
  auto runtime = open_runtime(*config);
  if (!runtime) {
    return 1;
  }
  return execute_signup(std::cin, std::cout, runtime->backend->services(), *runtime->id_gen,
                        *runtime->clock, *runtime->salts);
}
