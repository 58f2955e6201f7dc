#include "finval/app/signup_fields.h"

#include "finval/core/normalization.h"

#include <algorithm>

namespace finval::app {

using validation::ErrorCode;
using validation::Verdict;

namespace {

constexpr std::size_t kMaxEmailLength = 254;

Verdict<std::string> reject(ErrorCode code, std::string message) {
  return Verdict<std::string>::reject(code, std::move(message));
}

bool two_digits_between(std::string_view text, int low, int high) {
  if (!core::all_ascii_digits(text) || text.size() != 2) {
    return false;
  }
  const int value = (text[0] - '0') * 10 + (text[1] - '0');
  return value >= low && value <= high;
}

}  // namespace

Verdict<std::string> validate_email(std::string_view raw) {
  const std::string email = core::normalize_ascii_lower(core::trim_view(raw));
  if (email.empty()) {
    return reject(ErrorCode::kRequired, "Email is required");
  }

  const auto at = email.find('@');
  const bool one_at = at != std::string::npos && email.find('@', at + 1) == std::string::npos;
  const bool has_space = std::any_of(email.begin(), email.end(), core::is_ascii_space);
  if (!one_at || has_space || at == 0 || email.size() > kMaxEmailLength) {
    return reject(ErrorCode::kFormat, "Invalid email address");
  }

  const std::string_view domain = std::string_view{email}.substr(at + 1);
  const auto dot = domain.find('.');
  if (dot == std::string_view::npos || domain.front() == '.' || domain.back() == '.' ||
      domain.find("..") != std::string_view::npos) {
    return reject(ErrorCode::kFormat, "Invalid email address");
  }
  return Verdict<std::string>::accept(email);
}

Verdict<std::string> validate_required_text(std::string_view raw, std::string_view label) {
  std::string text = core::trim(raw);
  if (text.empty()) {
    return reject(ErrorCode::kRequired, std::string{label} + " is required");
  }
  return Verdict<std::string>::accept(std::move(text));
}

Verdict<std::string> validate_date_of_birth(std::string_view raw) {
  const std::string_view date = core::trim_view(raw);
  if (date.empty()) {
    return reject(ErrorCode::kRequired, "Date of birth is required");
  }
  const bool shaped = date.size() == 10 && date[4] == '-' && date[7] == '-' &&
                      core::all_ascii_digits(date.substr(0, 4)) &&
                      two_digits_between(date.substr(5, 2), 1, 12) &&
                      two_digits_between(date.substr(8, 2), 1, 31);
  if (!shaped) {
    return reject(ErrorCode::kFormat, "Date must be in YYYY-MM-DD format");
  }
  return Verdict<std::string>::accept(std::string{date});
}

Verdict<std::string> validate_zip_code(std::string_view raw) {
  const std::string_view zip = core::trim_view(raw);
  if (zip.empty()) {
    return reject(ErrorCode::kRequired, "ZIP code is required");
  }
  if (zip.size() != 5 || !core::all_ascii_digits(zip)) {
    return reject(ErrorCode::kFormat, "ZIP code must be exactly 5 digits");
  }
  return Verdict<std::string>::accept(std::string{zip});
}

const std::vector<std::string>& signup_field_keys() {
  static const std::vector<std::string> kKeys = {
      "email",         "password", "first_name", "last_name", "phone_number",
      "date_of_birth", "address",  "city",       "state",     "zip_code"};
  return kKeys;
}

validation::FieldFinding validate_signup_field(std::string_view key,
                                               std::optional<std::string_view> raw) {
  const std::string_view text = raw.value_or(std::string_view{});
  std::string name{key};

  if (key == "password") {
    return validation::validate_field(validation::Field::kPassword, raw);
  }
  if (key == "phone_number") {
    return validation::validate_field(validation::Field::kPhoneNumber, raw);
  }
  if (key == "state") {
    return validation::validate_field(validation::Field::kStateCode, raw);
  }

  if (key == "email") {
    const auto verdict = validate_email(text);
    return validation::to_finding(std::move(name), verdict, verdict.normalized());
  }
  if (key == "date_of_birth") {
    const auto verdict = validate_date_of_birth(text);
    return validation::to_finding(std::move(name), verdict, verdict.normalized());
  }
  if (key == "zip_code") {
    const auto verdict = validate_zip_code(text);
    return validation::to_finding(std::move(name), verdict, verdict.normalized());
  }
  if (key == "first_name" || key == "last_name" || key == "address" || key == "city") {
    const std::string_view label = key == "first_name"  ? "First name"
                                   : key == "last_name" ? "Last name"
                                   : key == "address"   ? "Address"
                                                        : "City";
    const auto verdict = validate_required_text(text, label);
    return validation::to_finding(std::move(name), verdict, verdict.normalized());
  }

  return validation::rejected_finding(std::move(name), ErrorCode::kFormat,
                                      "Unknown signup field: " + std::string{key});
}

}  // namespace finval::app
