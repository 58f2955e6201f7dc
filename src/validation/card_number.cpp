#include "finval/validation/card_number.h"

#include "finval/core/normalization.h"

namespace finval::validation {

namespace {

// Numeric value of the first `width` digits. Caller guarantees digits.size() >= width.
int prefix_value(std::string_view digits, std::size_t width) noexcept {
  int value = 0;
  for (std::size_t i = 0; i < width; ++i) {
    value = value * 10 + (digits[i] - '0');
  }
  return value;
}

bool prefix_in_range(std::string_view digits, std::size_t width, int low, int high) noexcept {
  if (digits.size() < width) {
    return false;
  }
  const int value = prefix_value(digits, width);
  return value >= low && value <= high;
}

bool is_visa(std::string_view d) noexcept {
  return d.size() == 16 && d.front() == '4';
}

bool is_mastercard(std::string_view d) noexcept {
  return d.size() == 16 && (prefix_in_range(d, 2, 51, 55) || prefix_in_range(d, 4, 2221, 2720));
}

bool is_amex(std::string_view d) noexcept {
  return d.size() == 15 && (prefix_in_range(d, 2, 34, 34) || prefix_in_range(d, 2, 37, 37));
}

bool is_discover(std::string_view d) noexcept {
  if (d.size() != 16) {
    return false;
  }
  return prefix_in_range(d, 4, 6011, 6011) || prefix_in_range(d, 3, 644, 649) ||
         prefix_in_range(d, 2, 65, 65) ||
         // UnionPay co-branded range
         prefix_in_range(d, 6, 622126, 622925) || prefix_in_range(d, 4, 6282, 6288);
}

}  // namespace

std::string_view card_network_name(CardNetwork network) noexcept {
  switch (network) {
    case CardNetwork::kVisa:
      return "Visa";
    case CardNetwork::kMastercard:
      return "Mastercard";
    case CardNetwork::kAmex:
      return "American Express";
    case CardNetwork::kDiscover:
      return "Discover";
    case CardNetwork::kUnsupported:
      return "Unsupported";
  }
  return "Unsupported";
}

bool luhn_check(std::string_view digits) noexcept {
  if (!core::all_ascii_digits(digits)) {
    return false;
  }

  int sum = 0;
  bool double_it = false;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    int digit = *it - '0';
    if (double_it) {
      digit *= 2;
      if (digit > 9) {
        digit -= 9;
      }
    }
    sum += digit;
    double_it = !double_it;
  }
  return sum % 10 == 0;
}

CardNetwork detect_card_network(std::string_view digits) noexcept {
  if (!core::all_ascii_digits(digits)) {
    return CardNetwork::kUnsupported;
  }
  if (is_visa(digits)) {
    return CardNetwork::kVisa;
  }
  if (is_mastercard(digits)) {
    return CardNetwork::kMastercard;
  }
  if (is_amex(digits)) {
    return CardNetwork::kAmex;
  }
  if (is_discover(digits)) {
    return CardNetwork::kDiscover;
  }
  return CardNetwork::kUnsupported;
}

Verdict<CardNumber> validate_card_number(std::string_view raw) {
  if (raw.empty()) {
    return Verdict<CardNumber>::reject(ErrorCode::kRequired, "Card number is required");
  }
  if (!core::all_ascii_digits(raw)) {
    return Verdict<CardNumber>::reject(ErrorCode::kFormat,
                                       "Card number must contain only digits");
  }
  if (raw.size() != 15 && raw.size() != 16) {
    return Verdict<CardNumber>::reject(ErrorCode::kFormat, "Card number must be 15 or 16 digits");
  }

  const CardNetwork network = detect_card_network(raw);
  if (network == CardNetwork::kUnsupported) {
    return Verdict<CardNumber>::reject(
        ErrorCode::kUnsupported,
        "We accept Visa, Mastercard, American Express, and Discover cards");
  }

  if (!luhn_check(raw)) {
    return Verdict<CardNumber>::reject(ErrorCode::kChecksum,
                                       "Invalid card number. Please check and try again");
  }

  return Verdict<CardNumber>::accept(CardNumber{network, static_cast<int>(raw.size())});
}

}  // namespace finval::validation
