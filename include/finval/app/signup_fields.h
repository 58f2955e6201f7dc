#pragma once

#include "finval/validation/field_rules.h"
#include "finval/validation/verdict.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace finval::app {

// Profile-field checks used by signup alongside the core validators.
// Each returns the stored (canonical) form on success.

// Trimmed, lowercased; exactly one '@', a non-empty local part, and a dotted domain.
[[nodiscard]] validation::Verdict<std::string> validate_email(std::string_view raw);

// Trimmed and non-empty. label names the field in the kRequired message.
[[nodiscard]] validation::Verdict<std::string> validate_required_text(std::string_view raw,
                                                                      std::string_view label);

// Shape only: YYYY-MM-DD with a month of 01-12 and a day of 01-31.
[[nodiscard]] validation::Verdict<std::string> validate_date_of_birth(std::string_view raw);

// Exactly five ASCII digits after trimming.
[[nodiscard]] validation::Verdict<std::string> validate_zip_code(std::string_view raw);

// Signup form keys in prompt order:
// email, password, first_name, last_name, phone_number, date_of_birth,
// address, city, state, zip_code.
[[nodiscard]] const std::vector<std::string>& signup_field_keys();

// Validates one signup form value by key. Core fields (password, phone_number,
// state) go through validation::validate_field. Unknown keys are kFormat.
[[nodiscard]] validation::FieldFinding validate_signup_field(
    std::string_view key, std::optional<std::string_view> raw);

}  // namespace finval::app
