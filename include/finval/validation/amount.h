#pragma once

#include "finval/core/types.h"
#include "finval/validation/verdict.h"

#include <string>
#include <string_view>
#include <variant>

namespace finval::validation {

inline constexpr core::Cents kMinAmountCents = 1;          // 0.01
inline constexpr core::Cents kMaxAmountCents = 1'000'000;  // 10000.00

// Amount is the canonical form of a monetary amount.
// cents is authoritative; formatted is always "<whole>.<two digits>" with no
// superfluous leading zeros, e.g. "0.50", "10.00", "9999.90".
struct Amount {
  core::Cents cents{0};
  std::string formatted;

  [[nodiscard]] double value() const noexcept { return static_cast<double>(cents) / 100.0; }
  friend bool operator==(const Amount&, const Amount&) = default;
};

// An amount token as supplied by a caller: the raw text of a form field, or a
// number decoded from a programmatic request.
using AmountInput = std::variant<std::string, double>;

// validate_amount parses and canonicalizes a textual amount.
// Surrounding ASCII whitespace is ignored. Rules (first failure wins):
//   empty                                  -> kRequired
//   leading '-'                            -> kRange
//   not digits with at most one '.'        -> kFormat
//   more than two fractional digits        -> kFormat
//   whole part with a superfluous leading 0 -> kLeadingZero
//   outside [0.01, 10000.00]               -> kRange
[[nodiscard]] Verdict<Amount> validate_amount(std::string_view raw);

// Numeric tokens are rendered with the shortest round-trip decimal
// representation and then validated by the textual rules.
[[nodiscard]] Verdict<Amount> validate_amount(double raw);

// Dispatches on the token's kind to one of the overloads above.
[[nodiscard]] Verdict<Amount> validate_amount_input(const AmountInput& raw);

// format_cents renders integer cents as "<whole>.<two digits>"; negative values get a '-'.
[[nodiscard]] std::string format_cents(core::Cents cents);

}  // namespace finval::validation
