#include "finval/validation/amount.h"

#include "finval/core/normalization.h"

#include <array>
#include <charconv>
#include <cmath>

namespace finval::validation {

namespace {

// Longest textual amount considered; anything longer is a format error.
// "10000.00" needs 8 characters, the slack tolerates harmless input like "0.5".
constexpr std::size_t kMaxAmountLength = 32;

constexpr const char* kRequiredMessage = "Amount is required";
constexpr const char* kNegativeMessage = "Amount must be a positive number";
constexpr const char* kNumericMessage =
    "Amount must be a numeric value using digits and an optional decimal point (e.g., 10.50)";
constexpr const char* kDecimalMessage =
    "Amount must be a valid decimal number with digits on both sides of the decimal point";
constexpr const char* kPrecisionMessage =
    "Amount cannot have more than 2 decimal places (the smallest unit is $0.01)";
constexpr const char* kLeadingZeroMessage =
    "Amount cannot have unnecessary leading zeros (use 0.50 instead of 00.50, 100 instead of "
    "00100)";
constexpr const char* kMinimumMessage = "Amount must be at least the minimum of $0.01";
constexpr const char* kMaximumMessage = "Amount cannot exceed the maximum of $10,000.00";

}  // namespace

std::string format_cents(core::Cents cents) {
  const bool negative = cents < 0;
  const core::Cents magnitude = negative ? -cents : cents;
  const core::Cents fraction = magnitude % 100;

  std::string out = negative ? "-" : "";
  out += std::to_string(magnitude / 100);
  out.push_back('.');
  out.push_back(static_cast<char>('0' + fraction / 10));
  out.push_back(static_cast<char>('0' + fraction % 10));
  return out;
}

Verdict<Amount> validate_amount(std::string_view raw) {
  const std::string_view text = core::trim_view(raw);

  if (text.empty()) {
    return Verdict<Amount>::reject(ErrorCode::kRequired, kRequiredMessage);
  }
  if (text.size() > kMaxAmountLength) {
    return Verdict<Amount>::reject(ErrorCode::kFormat, kNumericMessage);
  }
  if (text.front() == '-') {
    return Verdict<Amount>::reject(ErrorCode::kRange, kNegativeMessage);
  }

  // Character set: digits and '.', nothing else (no '$', ',', 'e', '+', spaces).
  std::size_t dot_count = 0;
  for (const char ch : text) {
    if (ch == '.') {
      ++dot_count;
    } else if (!core::is_ascii_digit(ch)) {
      return Verdict<Amount>::reject(ErrorCode::kFormat, kNumericMessage);
    }
  }
  if (dot_count > 1) {
    return Verdict<Amount>::reject(ErrorCode::kFormat, kDecimalMessage);
  }

  const auto dot = text.find('.');
  const std::string_view whole = text.substr(0, dot);
  const std::string_view fraction =
      dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

  if (whole.empty() || (dot != std::string_view::npos && fraction.empty())) {
    return Verdict<Amount>::reject(ErrorCode::kFormat, kDecimalMessage);
  }
  if (fraction.size() > 2) {
    return Verdict<Amount>::reject(ErrorCode::kFormat, kPrecisionMessage);
  }
  // A leading zero is only meaningful when it is the entire whole part.
  if (whole.size() > 1 && whole.front() == '0') {
    return Verdict<Amount>::reject(ErrorCode::kLeadingZero, kLeadingZeroMessage);
  }

  // The maximum has 5 whole digits; anything with more is over range without parsing.
  if (whole.size() > 5) {
    return Verdict<Amount>::reject(ErrorCode::kRange, kMaximumMessage);
  }

  core::Cents cents = 0;
  for (const char ch : whole) {
    cents = cents * 10 + (ch - '0');
  }
  cents *= 100;
  if (!fraction.empty()) {
    cents += (fraction[0] - '0') * 10;
    if (fraction.size() == 2) {
      cents += fraction[1] - '0';
    }
  }

  if (cents < kMinAmountCents) {
    return Verdict<Amount>::reject(ErrorCode::kRange, kMinimumMessage);
  }
  if (cents > kMaxAmountCents) {
    return Verdict<Amount>::reject(ErrorCode::kRange, kMaximumMessage);
  }

  return Verdict<Amount>::accept(Amount{cents, format_cents(cents)});
}

Verdict<Amount> validate_amount(double raw) {
  if (!std::isfinite(raw)) {
    return Verdict<Amount>::reject(ErrorCode::kFormat, kNumericMessage);
  }
  if (raw < 0.0) {
    return Verdict<Amount>::reject(ErrorCode::kRange, kNegativeMessage);
  }

  // Shortest representation that round-trips: 10.5 -> "10.5", 0.1 -> "0.1",
  // 1e21 -> "1e+21" (rejected as non-numeric text below).
  std::array<char, 64> buffer{};
  const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), raw);
  if (ec != std::errc{}) {
    return Verdict<Amount>::reject(ErrorCode::kFormat, kNumericMessage);
  }
  const auto length = static_cast<std::size_t>(end - buffer.data());
  return validate_amount(std::string_view(buffer.data(), length));
}

Verdict<Amount> validate_amount_input(const AmountInput& raw) {
  if (const auto* text = std::get_if<std::string>(&raw)) {
    return validate_amount(std::string_view(*text));
  }
  return validate_amount(std::get<double>(raw));
}

}  // namespace finval::validation
