#include "finval/validation/routing_number.h"

#include "finval/core/normalization.h"

#include <array>

namespace finval::validation {

namespace {

constexpr std::array<int, 9> kAbaWeights = {3, 7, 1, 3, 7, 1, 3, 7, 1};

}  // namespace

bool aba_checksum_valid(std::string_view digits) noexcept {
  if (digits.size() != kAbaWeights.size() || !core::all_ascii_digits(digits)) {
    return false;
  }

  int sum = 0;
  for (std::size_t i = 0; i < kAbaWeights.size(); ++i) {
    sum += kAbaWeights[i] * (digits[i] - '0');
  }
  return sum % 10 == 0;
}

Verdict<std::string> validate_routing_number(std::optional<std::string_view> raw) {
  const std::string_view text = raw.has_value() ? core::trim_view(*raw) : std::string_view{};
  if (text.empty()) {
    return Verdict<std::string>::reject(ErrorCode::kRequired,
                                        "Routing number is required for bank transfers");
  }

  if (text.size() != 9 || !core::all_ascii_digits(text)) {
    return Verdict<std::string>::reject(ErrorCode::kFormat,
                                        "Routing number must be exactly 9 digits");
  }

  // Both satisfy the weighted sum but identify no institution.
  if (text == "000000000" || text == "999999999") {
    return Verdict<std::string>::reject(ErrorCode::kRange,
                                        "Invalid routing number. No institution uses this number");
  }

  if (!aba_checksum_valid(text)) {
    return Verdict<std::string>::reject(
        ErrorCode::kChecksum, "Invalid routing number. Please check the number and try again");
  }

  return Verdict<std::string>::accept(std::string{text});
}

}  // namespace finval::validation
