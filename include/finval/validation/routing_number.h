#pragma once

#include "finval/validation/verdict.h"

#include <optional>
#include <string>
#include <string_view>

namespace finval::validation {

// aba_checksum_valid computes 3(d1+d4+d7) + 7(d2+d5+d8) + (d3+d6+d9) mod 10 == 0.
// Returns false unless input is exactly 9 ASCII digits. Does not reject the
// degenerate all-zero / all-nine values; validate_routing_number does.
[[nodiscard]] bool aba_checksum_valid(std::string_view digits) noexcept;

// validate_routing_number checks a 9-digit ABA routing number.
// Surrounding whitespace is trimmed; nothing else is rewritten.
// Order: kRequired (absent/empty), kFormat (not exactly 9 digits),
// kRange ("000000000" / "999999999"), kChecksum.
// The normalized value is the trimmed 9-digit string.
[[nodiscard]] Verdict<std::string> validate_routing_number(std::optional<std::string_view> raw);

}  // namespace finval::validation
