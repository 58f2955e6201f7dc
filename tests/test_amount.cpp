#include "finval/validation/amount.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace finval;
using validation::ErrorCode;

// ── canonical form ──────────────────────────────────────────────────────────

TEST_CASE("validate_amount: accepted inputs normalize to two decimals", "[amount]") {
  struct Case {
    const char* raw;
    core::Cents cents;
    const char* formatted;
  };
  const Case cases[] = {
      {"10", 1000, "10.00"},     {"10.5", 1050, "10.50"},    {"10.50", 1050, "10.50"},
      {"0.01", 1, "0.01"},       {"0.5", 50, "0.50"},        {"10000", 1000000, "10000.00"},
      {"9999.99", 999999, "9999.99"}, {"  42.10  ", 4210, "42.10"},
  };

  for (const auto& c : cases) {
    INFO("raw = " << c.raw);
    const auto verdict = validation::validate_amount(std::string_view{c.raw});
    REQUIRE(verdict.valid());
    CHECK(verdict.normalized()->cents == c.cents);
    CHECK(verdict.normalized()->formatted == c.formatted);
    CHECK(verdict.error_message().empty());
  }
}

TEST_CASE("validate_amount: normalized output is a fixed point", "[amount]") {
  for (const char* raw : {"1", "1.1", "0.99", "250.00", "10000"}) {
    const auto first = validation::validate_amount(std::string_view{raw});
    REQUIRE(first.valid());
    const auto second = validation::validate_amount(first.normalized()->formatted);
    REQUIRE(second.valid());
    CHECK(second.normalized() == first.normalized());
  }
}

// ── boundaries ──────────────────────────────────────────────────────────────

TEST_CASE("validate_amount: range boundaries", "[amount]") {
  CHECK(validation::validate_amount(std::string_view{"0.01"}).valid());
  CHECK(validation::validate_amount(std::string_view{"10000.00"}).valid());

  const auto zero = validation::validate_amount(std::string_view{"0"});
  CHECK_FALSE(zero.valid());
  CHECK(zero.error_code() == ErrorCode::kRange);

  const auto zero_cents = validation::validate_amount(std::string_view{"0.00"});
  CHECK(zero_cents.error_code() == ErrorCode::kRange);
  CHECK(zero_cents.error_message() == "Amount must be at least the minimum of $0.01");

  const auto over = validation::validate_amount(std::string_view{"10000.01"});
  CHECK(over.error_code() == ErrorCode::kRange);
  CHECK(over.error_message() == "Amount cannot exceed the maximum of $10,000.00");

  CHECK(validation::validate_amount(std::string_view{"123456"}).error_code() == ErrorCode::kRange);
}

// ── rejections ──────────────────────────────────────────────────────────────

TEST_CASE("validate_amount: error codes by rule", "[amount]") {
  CHECK(validation::validate_amount(std::string_view{""}).error_code() == ErrorCode::kRequired);
  CHECK(validation::validate_amount(std::string_view{"   "}).error_code() ==
        ErrorCode::kRequired);
  CHECK(validation::validate_amount(std::string_view{"-5"}).error_code() == ErrorCode::kRange);
  CHECK(validation::validate_amount(std::string_view{"$10"}).error_code() == ErrorCode::kFormat);
  CHECK(validation::validate_amount(std::string_view{"1,000"}).error_code() ==
        ErrorCode::kFormat);
  CHECK(validation::validate_amount(std::string_view{"1e3"}).error_code() == ErrorCode::kFormat);
  CHECK(validation::validate_amount(std::string_view{"abc"}).error_code() == ErrorCode::kFormat);
  CHECK(validation::validate_amount(std::string_view{"1.2.3"}).error_code() ==
        ErrorCode::kFormat);
  CHECK(validation::validate_amount(std::string_view{".5"}).error_code() == ErrorCode::kFormat);
  CHECK(validation::validate_amount(std::string_view{"5."}).error_code() == ErrorCode::kFormat);
  CHECK(validation::validate_amount(std::string_view{"10.123"}).error_code() ==
        ErrorCode::kFormat);
}

TEST_CASE("validate_amount: superfluous leading zeros", "[amount]") {
  CHECK(validation::validate_amount(std::string_view{"00.50"}).error_code() ==
        ErrorCode::kLeadingZero);
  CHECK(validation::validate_amount(std::string_view{"00100"}).error_code() ==
        ErrorCode::kLeadingZero);
  CHECK(validation::validate_amount(std::string_view{"0.50"}).valid());
}

TEST_CASE("validate_amount: invalid verdict carries no value", "[amount]") {
  const auto verdict = validation::validate_amount(std::string_view{"abc"});
  CHECK_FALSE(verdict.valid());
  CHECK_FALSE(verdict.normalized().has_value());
  CHECK_FALSE(verdict.error_message().empty());
}

// ── numeric tokens ──────────────────────────────────────────────────────────

TEST_CASE("validate_amount: numeric tokens use the textual rules", "[amount]") {
  const auto ten_and_a_half = validation::validate_amount(10.5);
  REQUIRE(ten_and_a_half.valid());
  CHECK(ten_and_a_half.normalized()->formatted == "10.50");

  const auto whole = validation::validate_amount(25.0);
  REQUIRE(whole.valid());
  CHECK(whole.normalized()->cents == 2500);

  CHECK(validation::validate_amount(-1.0).error_code() == ErrorCode::kRange);
  CHECK(validation::validate_amount(0.001).error_code() == ErrorCode::kFormat);
  CHECK(validation::validate_amount(1e21).error_code() == ErrorCode::kFormat);
}

TEST_CASE("validate_amount_input: dispatches on the token kind", "[amount]") {
  const validation::AmountInput text = std::string{"12.30"};
  const validation::AmountInput number = 12.3;

  const auto from_text = validation::validate_amount_input(text);
  const auto from_number = validation::validate_amount_input(number);
  REQUIRE(from_text.valid());
  REQUIRE(from_number.valid());
  CHECK(from_text.normalized() == from_number.normalized());
}

TEST_CASE("format_cents: renders two decimals", "[amount]") {
  CHECK(validation::format_cents(0) == "0.00");
  CHECK(validation::format_cents(5) == "0.05");
  CHECK(validation::format_cents(123456) == "1234.56");
  CHECK(validation::format_cents(-250) == "-2.50");
}
