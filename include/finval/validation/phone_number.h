#pragma once

#include "finval/validation/verdict.h"

#include <string>
#include <string_view>

namespace finval::validation {

// validate_phone_number parses a North American (NANP) phone number written in
// any common presentation and produces the canonical "+1NXXNXXXXXX" form.
//
// Accepted presentations include "2025551234", "202-555-1234", "(202) 555-1234",
// "202.555.1234", "1 202 555 1234" and "+1 (202) 555-1234"; all of them normalize
// to "+12025551234".
//
// Structural rules on the 10-digit national number NPA-NXX-XXXX:
//   NPA (area code): first digit 2-9, not N11, not toll-free (800/833/844/855/866/877/888),
//                    not premium rate (900)
//   NXX (exchange):  first digit 2-9, not N11 (555 is always allowed)
// Violations of those rules and non-"+1" country codes are kUnsupported; shape
// problems (characters, digit count) are kFormat; blank input is kRequired.
[[nodiscard]] Verdict<std::string> validate_phone_number(std::string_view raw);

}  // namespace finval::validation
