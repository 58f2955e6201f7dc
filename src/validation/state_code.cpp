#include "finval/validation/state_code.h"

#include "finval/core/normalization.h"

#include <algorithm>
#include <array>

namespace finval::validation {

namespace {

constexpr std::array<std::string_view, 50> kStates = {
    "AL", "AK", "AZ", "AR", "CA", "CO", "CT", "DE", "FL", "GA", "HI", "ID", "IL",
    "IN", "IA", "KS", "KY", "LA", "ME", "MD", "MA", "MI", "MN", "MS", "MO", "MT",
    "NE", "NV", "NH", "NJ", "NM", "NY", "NC", "ND", "OH", "OK", "OR", "PA", "RI",
    "SC", "SD", "TN", "TX", "UT", "VT", "VA", "WA", "WV", "WI", "WY"};

constexpr std::array<std::string_view, 1> kFederalDistrict = {"DC"};

constexpr std::array<std::string_view, 5> kTerritories = {"AS", "GU", "MP", "PR", "VI"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& codes, std::string_view code) {
  return std::find(codes.begin(), codes.end(), code) != codes.end();
}

template <std::size_t N>
std::vector<std::string> to_strings(const std::array<std::string_view, N>& codes) {
  return std::vector<std::string>(codes.begin(), codes.end());
}

}  // namespace

bool is_valid_state_code(std::string_view code) {
  return contains(kStates, code) || contains(kFederalDistrict, code) ||
         contains(kTerritories, code);
}

Verdict<std::string> validate_state_code(std::string_view raw) {
  const std::string code = core::normalize_ascii_upper(core::trim_view(raw));
  if (code.empty()) {
    return Verdict<std::string>::reject(ErrorCode::kRequired, "State is required");
  }
  if (code.size() != 2 || !core::is_ascii_upper(code[0]) || !core::is_ascii_upper(code[1])) {
    return Verdict<std::string>::reject(
        ErrorCode::kFormat, "Please enter a valid US state code (e.g., CA, NY, TX, FL)");
  }
  if (!is_valid_state_code(code)) {
    return Verdict<std::string>::reject(
        ErrorCode::kUnsupported,
        "'" + code +
            "' is not a valid US state code. Please enter a valid 2-letter state code (e.g., "
            "CA, NY, TX, FL)");
  }
  return Verdict<std::string>::accept(code);
}

std::vector<std::string> all_state_codes() {
  std::vector<std::string> codes = to_strings(kStates);
  codes.insert(codes.end(), kFederalDistrict.begin(), kFederalDistrict.end());
  codes.insert(codes.end(), kTerritories.begin(), kTerritories.end());
  std::sort(codes.begin(), codes.end());
  return codes;
}

StateCodeGroups state_codes_by_category() {
  return StateCodeGroups{to_strings(kStates), to_strings(kFederalDistrict),
                         to_strings(kTerritories)};
}

}  // namespace finval::validation
