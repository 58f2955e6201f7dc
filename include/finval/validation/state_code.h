#pragma once

#include "finval/validation/verdict.h"

#include <string>
#include <string_view>
#include <vector>

namespace finval::validation {

// Postal codes accepted for a US mailing address, grouped the way address forms
// present them.
struct StateCodeGroups {
  std::vector<std::string> states;             // 50
  std::vector<std::string> federal_district;   // DC
  std::vector<std::string> territories;        // AS GU MP PR VI
};

// Trims and uppercases, then checks membership in the 56-code set.
// Output: the uppercase two-letter code.
[[nodiscard]] Verdict<std::string> validate_state_code(std::string_view raw);

[[nodiscard]] bool is_valid_state_code(std::string_view code);

// All 56 codes (50 states, DC, 5 territories), sorted ascending.
[[nodiscard]] std::vector<std::string> all_state_codes();

[[nodiscard]] StateCodeGroups state_codes_by_category();

}  // namespace finval::validation
