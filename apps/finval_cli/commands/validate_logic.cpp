#include "validate_logic.h"

#include "finval/app/finding_json.h"
#include "finval/validation/field_rules.h"
#include "finval/validation/state_code.h"

#include <iostream>
#include <string_view>
#include <vector>

namespace {

void print_codes(std::ostream& out, const char* heading, const std::vector<std::string>& codes) {
  out << heading << " (" << codes.size() << "):";
  for (const auto& code : codes) {
    out << " " << code;
  }
  out << "\n";
}

}  // namespace

int execute_validate(const std::string& field_name, const std::optional<std::string>& value,
                     std::ostream& out) {
  const auto field = finval::validation::parse_field(field_name);
  if (!field.has_value()) {
    std::cerr << "Unknown field: " << field_name
              << " (valid: amount, card_number, routing_number, phone_number, password, state)\n";
    return 1;
  }

  std::optional<std::string_view> raw;
  if (value.has_value()) {
    raw = *value;
  }
  const auto finding = finval::validation::validate_field(*field, raw);
  out << finval::app::finding_to_json(finding).dump(2) << "\n";
  return finding.valid ? 0 : 1;
}

int execute_states(std::ostream& out) {
  const auto groups = finval::validation::state_codes_by_category();
  print_codes(out, "States", groups.states);
  print_codes(out, "Federal district", groups.federal_district);
  print_codes(out, "Territories", groups.territories);
  return 0;
}
