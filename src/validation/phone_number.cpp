#include "finval/validation/phone_number.h"

#include "finval/core/normalization.h"

#include <algorithm>
#include <array>

namespace finval::validation {

namespace {

constexpr std::size_t kMaxPhoneInputLength = 50;
constexpr std::size_t kNationalNumberLength = 10;

constexpr std::array<std::string_view, 7> kTollFreeAreaCodes = {"800", "833", "844", "855",
                                                                "866", "877", "888"};
constexpr std::string_view kPremiumRateAreaCode = "900";
constexpr std::string_view kFictionalExchange = "555";

constexpr const char* kNorthAmericaOnlyMessage =
    "Only North American (US/Canada) phone numbers are accepted";

bool is_phone_punctuation(char ch) noexcept {
  return ch == ' ' || ch == '-' || ch == '(' || ch == ')' || ch == '.' || ch == '+';
}

// N11 codes (211, 311, ..., 911) are reserved for special services.
bool is_n11(std::string_view code) noexcept {
  return code.size() == 3 && code[1] == '1' && code[2] == '1';
}

Verdict<std::string> reject(ErrorCode code, std::string message) {
  return Verdict<std::string>::reject(code, std::move(message));
}

Verdict<std::string> check_area_code(std::string_view npa) {
  if (npa[0] == '0' || npa[0] == '1') {
    return reject(ErrorCode::kUnsupported,
                  "Invalid area code. Area codes cannot start with 0 or 1.");
  }
  if (is_n11(npa)) {
    return reject(ErrorCode::kUnsupported,
                  "Invalid area code. N11 codes are reserved for special services.");
  }
  if (std::find(kTollFreeAreaCodes.begin(), kTollFreeAreaCodes.end(), npa) !=
      kTollFreeAreaCodes.end()) {
    return reject(ErrorCode::kUnsupported, "Toll-free numbers are not valid for registration");
  }
  if (npa == kPremiumRateAreaCode) {
    return reject(ErrorCode::kUnsupported,
                  "Premium rate numbers are not valid for registration");
  }
  return Verdict<std::string>::accept(std::string{npa});
}

Verdict<std::string> check_exchange_code(std::string_view nxx) {
  if (nxx[0] == '0' || nxx[0] == '1') {
    return reject(ErrorCode::kUnsupported,
                  "Invalid exchange code. Exchange codes cannot start with 0 or 1.");
  }
  if (is_n11(nxx) && nxx != kFictionalExchange) {
    return reject(ErrorCode::kUnsupported,
                  "Invalid exchange code. N11 codes are reserved for special services.");
  }
  return Verdict<std::string>::accept(std::string{nxx});
}

}  // namespace

Verdict<std::string> validate_phone_number(std::string_view raw) {
  const std::string_view text = core::trim_view(raw);
  if (text.empty()) {
    return reject(ErrorCode::kRequired, "Phone number is required");
  }
  if (text.size() > kMaxPhoneInputLength) {
    return reject(ErrorCode::kFormat, "Invalid phone number format");
  }

  for (const char ch : text) {
    if (!core::is_ascii_digit(ch) && !is_phone_punctuation(ch)) {
      return reject(ErrorCode::kFormat,
                    "Invalid phone number format. Only digits, spaces, and common separators "
                    "are allowed.");
    }
  }

  const std::string digits = core::digits_only(text);
  if (digits.empty()) {
    return reject(ErrorCode::kFormat, "Phone number must contain digits");
  }
  if (digits.size() == 3) {
    return reject(ErrorCode::kFormat,
                  "Emergency and service numbers are not valid phone numbers");
  }

  // A leading '+' announces a country code; only +1 is North American. Any other
  // '+' is a separator.
  if (text.front() == '+') {
    const auto first_digit = text.find_first_of("0123456789");
    if (first_digit == std::string_view::npos || text[first_digit] != '1') {
      return reject(ErrorCode::kUnsupported, kNorthAmericaOnlyMessage);
    }
  }

  std::string_view national = digits;
  if (national.size() == kNationalNumberLength + 1 && national.front() == '1') {
    national.remove_prefix(1);
  }

  if (national.size() < kNationalNumberLength) {
    return reject(ErrorCode::kFormat,
                  "Phone number has too few digits. Enter a 10-digit North American number.");
  }
  if (national.size() > kNationalNumberLength) {
    return reject(ErrorCode::kFormat,
                  "Phone number has too many digits. Only North American (US/Canada) phone "
                  "numbers are accepted.");
  }

  if (national == "0000000000" || national == "1111111111") {
    return reject(ErrorCode::kFormat, "Invalid phone number");
  }

  if (auto area = check_area_code(national.substr(0, 3)); !area.valid()) {
    return area;
  }
  if (auto exchange = check_exchange_code(national.substr(3, 3)); !exchange.valid()) {
    return exchange;
  }

  return Verdict<std::string>::accept("+1" + std::string{national});
}

}  // namespace finval::validation
