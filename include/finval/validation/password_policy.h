#pragma once

#include "finval/validation/verdict.h"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace finval::validation {

constexpr std::size_t kMinPasswordLength = 8;

// Policy predicates in evaluation order.
enum class PasswordRule {
  kMinLength,
  kUppercase,
  kLowercase,
  kDigit,
  kSpecialCharacter,
  kNoDigitSequence,
  kNoKeyboardRun,
  kNoLetterSequence,
  kNoRepeatedCharacter,
};

struct PasswordViolation {
  PasswordRule rule;
  std::string message;
};

// A password is never normalized: an accepted verdict carries std::monostate only.
// Every failure is ErrorCode::kPolicy and reports the first failing predicate.
[[nodiscard]] Verdict<std::monostate> validate_password(std::string_view password);

// Every failing predicate, in evaluation order. Empty when the password is acceptable.
[[nodiscard]] std::vector<PasswordViolation> list_password_violations(std::string_view password);

}  // namespace finval::validation
