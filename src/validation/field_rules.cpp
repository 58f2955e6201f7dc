#include "finval/validation/field_rules.h"

#include "finval/validation/amount.h"
#include "finval/validation/card_number.h"
#include "finval/validation/password_policy.h"
#include "finval/validation/phone_number.h"
#include "finval/validation/routing_number.h"
#include "finval/validation/state_code.h"

#include <algorithm>

namespace finval::validation {

std::string_view field_name(Field field) noexcept {
  switch (field) {
    case Field::kAmount:
      return "amount";
    case Field::kCardNumber:
      return "card_number";
    case Field::kRoutingNumber:
      return "routing_number";
    case Field::kPhoneNumber:
      return "phone_number";
    case Field::kPassword:
      return "password";
    case Field::kStateCode:
      return "state";
  }
  return "unknown";
}

const std::vector<Field>& all_fields() {
  static const std::vector<Field> kFields = {Field::kAmount,      Field::kCardNumber,
                                             Field::kRoutingNumber, Field::kPhoneNumber,
                                             Field::kPassword,    Field::kStateCode};
  return kFields;
}

std::optional<Field> parse_field(std::string_view name) noexcept {
  for (const auto field : all_fields()) {
    if (field_name(field) == name) {
      return field;
    }
  }
  return std::nullopt;
}

FieldFinding accepted_finding(std::string field, std::optional<std::string> normalized) {
  FieldFinding finding;
  finding.field = std::move(field);
  finding.valid = true;
  finding.normalized = std::move(normalized);
  return finding;
}

FieldFinding rejected_finding(std::string field, ErrorCode code, std::string message) {
  FieldFinding finding;
  finding.field = std::move(field);
  finding.error_code = code;
  finding.message = std::move(message);
  return finding;
}

FieldFinding validate_field(Field field, std::optional<std::string_view> raw) {
  std::string name{field_name(field)};
  const std::string_view text = raw.value_or(std::string_view{});

  switch (field) {
    case Field::kAmount: {
      auto verdict = validate_amount(text);
      return to_finding(std::move(name), verdict,
                        verdict.valid() ? std::optional{verdict.normalized()->formatted}
                                        : std::nullopt);
    }
    case Field::kCardNumber: {
      auto verdict = validate_card_number(text);
      return to_finding(
          std::move(name), verdict,
          verdict.valid()
              ? std::optional{std::string{card_network_name(verdict.normalized()->network)}}
              : std::nullopt);
    }
    case Field::kRoutingNumber: {
      auto verdict = validate_routing_number(raw);
      return to_finding(std::move(name), verdict, verdict.normalized());
    }
    case Field::kPhoneNumber: {
      auto verdict = validate_phone_number(text);
      return to_finding(std::move(name), verdict, verdict.normalized());
    }
    case Field::kPassword:
      return to_finding(std::move(name), validate_password(text));
    case Field::kStateCode: {
      auto verdict = validate_state_code(text);
      return to_finding(std::move(name), verdict, verdict.normalized());
    }
  }
  return rejected_finding(std::move(name), ErrorCode::kFormat, "Unknown field");
}

bool GateReport::passed() const noexcept {
  return std::all_of(findings_.begin(), findings_.end(),
                     [](const FieldFinding& f) { return f.valid; });
}

const FieldFinding* GateReport::first_failure() const noexcept {
  const auto it = std::find_if(findings_.begin(), findings_.end(),
                               [](const FieldFinding& f) { return !f.valid; });
  return it == findings_.end() ? nullptr : &*it;
}

std::optional<std::string> GateReport::normalized(std::string_view field) const {
  for (const auto& finding : findings_) {
    if (finding.field == field && finding.valid) {
      return finding.normalized;
    }
  }
  return std::nullopt;
}

}  // namespace finval::validation
