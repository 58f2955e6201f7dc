#include "validate.h"

#include "validate_logic.h"
#include <iostream>
#include <optional>
#include <string>

int cmd_validate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc < 3 || argc > 4) {
    std::cerr << "Usage: finval_cli validate <field> [<value>]\n";
    return 1;
  }
  const std::string field = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  std::optional<std::string> value;
  if (argc == 4) {
    value = argv[3];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }
  return execute_validate(field, value, std::cout);
}

int cmd_states(int argc, char* /*argv*/[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc != 2) {
    std::cerr << "Usage: finval_cli states\n";
    return 1;
  }
  return execute_states(std::cout);
}
