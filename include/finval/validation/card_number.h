#pragma once

#include "finval/validation/verdict.h"

#include <string_view>

namespace finval::validation {

enum class CardNetwork {
  kVisa,
  kMastercard,
  kAmex,
  kDiscover,
  kUnsupported,
};

// Display name used in user-facing text ("Visa", "American Express", ...).
[[nodiscard]] std::string_view card_network_name(CardNetwork network) noexcept;

// CardNumber is what a valid verdict reports about a card. The digits themselves
// are deliberately not part of the result so they are never echoed back.
struct CardNumber {
  CardNetwork network{CardNetwork::kUnsupported};
  int length_class{16};  // 15 or 16

  friend bool operator==(const CardNumber&, const CardNumber&) = default;
};

// luhn_check applies the mod-10 algorithm to a string of ASCII digits.
// Starting from the rightmost digit, every second digit is doubled (minus 9 when
// the product exceeds 9); the number is valid iff the digit sum is divisible by 10.
// Returns false for empty input or any non-digit character.
[[nodiscard]] bool luhn_check(std::string_view digits) noexcept;

// detect_card_network matches the prefix and length against the four accepted networks:
//   Visa        4                                              length 16
//   Mastercard  51-55, 2221-2720                               length 16
//   Amex        34, 37                                         length 15
//   Discover    6011, 644-649, 65, 622126-622925, 6282-6288   length 16
// Returns kUnsupported for anything else (including non-digit input).
[[nodiscard]] CardNetwork detect_card_network(std::string_view digits) noexcept;

// validate_card_number requires the caller's input to already be digits only;
// separators are not stripped. Checks run in order: kRequired, kFormat (charset,
// then length 15/16), kUnsupported (network), kChecksum (Luhn).
[[nodiscard]] Verdict<CardNumber> validate_card_number(std::string_view raw);

}  // namespace finval::validation
