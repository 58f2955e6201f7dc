#include "finval/validation/password_policy.h"

#include "finval/core/normalization.h"

#include <algorithm>
#include <array>

namespace finval::validation {

namespace {

constexpr std::string_view kSpecialCharacters = "!@#$%^&*()_+-=[]{};':\"\\|,.<>/?";

constexpr std::array<std::string_view, 16> kDigitRuns = {
    "0123", "1234", "2345", "3456", "4567", "5678", "6789", "7890",
    "3210", "4321", "5432", "6543", "7654", "8765", "9876", "0987"};

constexpr std::array<std::string_view, 6> kKeyboardRuns = {"qwert", "werty", "asdfg",
                                                           "sdfgh", "zxcvb", "xcvbn"};

constexpr std::size_t kRunLength = 4;

constexpr const char* kSequenceMessage = "Password cannot contain sequential patterns";

bool contains_any(std::string_view haystack, const auto& needles) {
  return std::any_of(needles.begin(), needles.end(), [haystack](std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
  });
}

bool has_letter_sequence(std::string_view lowered) {
  if (lowered.size() < kRunLength) {
    return false;
  }
  for (std::size_t i = 0; i + kRunLength <= lowered.size(); ++i) {
    if (!core::is_ascii_lower(lowered[i])) {
      continue;
    }
    bool ascending = true;
    for (std::size_t k = 1; k < kRunLength; ++k) {
      if (!core::is_ascii_lower(lowered[i + k]) ||
          lowered[i + k] != static_cast<char>(lowered[i] + static_cast<char>(k))) {
        ascending = false;
        break;
      }
    }
    if (ascending) {
      return true;
    }
  }
  return false;
}

bool has_repeated_character(std::string_view password) {
  std::size_t run = 0;
  for (std::size_t i = 0; i < password.size(); ++i) {
    run = (i > 0 && password[i] == password[i - 1]) ? run + 1 : 1;
    if (run >= kRunLength) {
      return true;
    }
  }
  return false;
}

// Returns the message for a failing rule, or an empty string when the rule holds.
std::string check_rule(PasswordRule rule, std::string_view password, std::string_view lowered) {
  switch (rule) {
    case PasswordRule::kMinLength:
      return password.size() < kMinPasswordLength ? "Password must be at least 8 characters"
                                                  : "";
    case PasswordRule::kUppercase:
      return std::none_of(password.begin(), password.end(), core::is_ascii_upper)
                 ? "Password must contain at least one uppercase letter"
                 : "";
    case PasswordRule::kLowercase:
      return std::none_of(password.begin(), password.end(), core::is_ascii_lower)
                 ? "Password must contain at least one lowercase letter"
                 : "";
    case PasswordRule::kDigit:
      return std::none_of(password.begin(), password.end(), core::is_ascii_digit)
                 ? "Password must contain at least one number"
                 : "";
    case PasswordRule::kSpecialCharacter:
      return password.find_first_of(kSpecialCharacters) == std::string_view::npos
                 ? "Password must contain at least one special character"
                 : "";
    case PasswordRule::kNoDigitSequence:
      return contains_any(password, kDigitRuns) ? kSequenceMessage : "";
    case PasswordRule::kNoKeyboardRun:
      return contains_any(lowered, kKeyboardRuns) ? kSequenceMessage : "";
    case PasswordRule::kNoLetterSequence:
      return has_letter_sequence(lowered) ? kSequenceMessage : "";
    case PasswordRule::kNoRepeatedCharacter:
      return has_repeated_character(password) ? "Password cannot contain repeated characters"
                                              : "";
  }
  return "";
}

constexpr std::array<PasswordRule, 9> kRuleOrder = {
    PasswordRule::kMinLength,         PasswordRule::kUppercase,
    PasswordRule::kLowercase,         PasswordRule::kDigit,
    PasswordRule::kSpecialCharacter,  PasswordRule::kNoDigitSequence,
    PasswordRule::kNoKeyboardRun,     PasswordRule::kNoLetterSequence,
    PasswordRule::kNoRepeatedCharacter};

}  // namespace

Verdict<std::monostate> validate_password(std::string_view password) {
  const std::string lowered = core::normalize_ascii_lower(password);
  for (const auto rule : kRuleOrder) {
    if (auto message = check_rule(rule, password, lowered); !message.empty()) {
      return Verdict<std::monostate>::reject(ErrorCode::kPolicy, std::move(message));
    }
  }
  return Verdict<std::monostate>::accept(std::monostate{});
}

std::vector<PasswordViolation> list_password_violations(std::string_view password) {
  const std::string lowered = core::normalize_ascii_lower(password);
  std::vector<PasswordViolation> violations;
  for (const auto rule : kRuleOrder) {
    if (auto message = check_rule(rule, password, lowered); !message.empty()) {
      violations.push_back(PasswordViolation{rule, std::move(message)});
    }
  }
  return violations;
}

}  // namespace finval::validation
