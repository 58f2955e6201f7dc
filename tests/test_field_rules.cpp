#include "finval/validation/field_rules.h"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string_view>

using namespace finval;
using validation::ErrorCode;
using validation::Field;

// ── field names ─────────────────────────────────────────────────────────────

TEST_CASE("field_name and parse_field agree", "[field_rules]") {
  for (const auto field : validation::all_fields()) {
    CHECK(validation::parse_field(validation::field_name(field)) == field);
  }
  CHECK(validation::field_name(Field::kStateCode) == "state");
  CHECK_FALSE(validation::parse_field("ssn").has_value());
}

// ── dispatch ────────────────────────────────────────────────────────────────

TEST_CASE("validate_field: normalized value per field", "[field_rules]") {
  const auto amount = validation::validate_field(Field::kAmount, std::string_view{"12.5"});
  CHECK(amount.valid);
  CHECK(amount.field == "amount");
  CHECK(amount.normalized == "12.50");

  const auto card = validation::validate_field(Field::kCardNumber,
                                               std::string_view{"5555555555554444"});
  CHECK(card.valid);
  CHECK(card.normalized == "Mastercard");

  const auto routing = validation::validate_field(Field::kRoutingNumber,
                                                  std::string_view{"021000021"});
  CHECK(routing.normalized == "021000021");

  const auto phone = validation::validate_field(Field::kPhoneNumber,
                                                std::string_view{"(202) 555-1234"});
  CHECK(phone.normalized == "+12025551234");

  const auto state = validation::validate_field(Field::kStateCode, std::string_view{"tx"});
  CHECK(state.normalized == "TX");
}

TEST_CASE("validate_field: passwords are never echoed", "[field_rules]") {
  const auto finding = validation::validate_field(Field::kPassword, std::string_view{"Password1!"});
  CHECK(finding.valid);
  CHECK_FALSE(finding.normalized.has_value());
  CHECK(finding.message.empty());
}

TEST_CASE("validate_field: rejected findings carry code and message only", "[field_rules]") {
  const auto finding = validation::validate_field(Field::kCardNumber,
                                                  std::string_view{"4111111111111112"});
  CHECK_FALSE(finding.valid);
  CHECK_FALSE(finding.normalized.has_value());
  CHECK(finding.error_code == ErrorCode::kChecksum);
  CHECK(finding.message == "Invalid card number. Please check and try again");
}

TEST_CASE("validate_field: absent values", "[field_rules]") {
  for (const auto field : {Field::kAmount, Field::kCardNumber, Field::kRoutingNumber,
                           Field::kPhoneNumber, Field::kStateCode}) {
    INFO("field = " << validation::field_name(field));
    CHECK(validation::validate_field(field, std::nullopt).error_code == ErrorCode::kRequired);
  }
  const auto password = validation::validate_field(Field::kPassword, std::nullopt);
  CHECK(password.error_code == ErrorCode::kPolicy);
  CHECK(password.message == "Password must be at least 8 characters");
}

// ── gate ────────────────────────────────────────────────────────────────────

TEST_CASE("GateReport: passes only when every finding is valid", "[field_rules]") {
  validation::GateReport report;
  CHECK(report.passed());
  CHECK(report.first_failure() == nullptr);

  report.add(validation::validate_field(Field::kAmount, std::string_view{"10"}));
  report.add(validation::validate_field(Field::kStateCode, std::string_view{"ZZ"}));
  report.add(validation::validate_field(Field::kPhoneNumber, std::string_view{"abc"}));

  CHECK_FALSE(report.passed());
  REQUIRE(report.first_failure() != nullptr);
  CHECK(report.first_failure()->field == "state");
  CHECK(report.findings().size() == 3);
  CHECK(report.normalized("amount") == "10.00");
  CHECK_FALSE(report.normalized("state").has_value());
  CHECK_FALSE(report.normalized("missing").has_value());
}
