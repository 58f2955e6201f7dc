#include "finval/app/signup_fields.h"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string_view>

using namespace finval;
using validation::ErrorCode;

TEST_CASE("validate_email: trimmed and lowercased", "[signup_fields]") {
  const auto verdict = app::validate_email("  Jane.Doe@Example.COM ");
  REQUIRE(verdict.valid());
  CHECK(verdict.normalized().value() == "jane.doe@example.com");
}

TEST_CASE("validate_email: rejections", "[signup_fields]") {
  CHECK(app::validate_email("").error_code() == ErrorCode::kRequired);
  for (const char* raw : {"jane", "@example.com", "jane@@example.com", "jane@example",
                          "jane@.example.com", "jane@example.com.", "jane@example..com",
                          "ja ne@example.com", "a@b@example.com"}) {
    INFO("email = " << raw);
    CHECK(app::validate_email(raw).error_code() == ErrorCode::kFormat);
  }
}

TEST_CASE("validate_date_of_birth: shape only", "[signup_fields]") {
  CHECK(app::validate_date_of_birth("1990-04-15").valid());
  CHECK(app::validate_date_of_birth("").error_code() == ErrorCode::kRequired);
  CHECK(app::validate_date_of_birth("04/15/1990").error_code() == ErrorCode::kFormat);
  CHECK(app::validate_date_of_birth("1990-13-01").error_code() == ErrorCode::kFormat);
  CHECK(app::validate_date_of_birth("1990-00-10").error_code() == ErrorCode::kFormat);
  CHECK(app::validate_date_of_birth("1990-01-32").error_code() == ErrorCode::kFormat);
}

TEST_CASE("validate_zip_code: five digits", "[signup_fields]") {
  CHECK(app::validate_zip_code(" 94105 ").normalized().value() == "94105");
  CHECK(app::validate_zip_code("").error_message() == "ZIP code is required");
  CHECK(app::validate_zip_code("9410").error_code() == ErrorCode::kFormat);
  CHECK(app::validate_zip_code("94105-1234").error_code() == ErrorCode::kFormat);
}

TEST_CASE("validate_signup_field: routes core fields through validate_field",
          "[signup_fields]") {
  const auto phone = app::validate_signup_field("phone_number", std::string_view{"202.555.1234"});
  CHECK(phone.valid);
  CHECK(phone.normalized == "+12025551234");

  const auto state = app::validate_signup_field("state", std::string_view{"ny"});
  CHECK(state.normalized == "NY");

  const auto city = app::validate_signup_field("city", std::nullopt);
  CHECK(city.error_code == ErrorCode::kRequired);
  CHECK(city.message == "City is required");

  CHECK(app::validate_signup_field("nickname", std::string_view{"x"}).error_code ==
        ErrorCode::kFormat);
}

TEST_CASE("signup_field_keys: form order", "[signup_fields]") {
  const auto& keys = app::signup_field_keys();
  REQUIRE(keys.size() == 10);
  CHECK(keys.front() == "email");
  CHECK(keys.back() == "zip_code");
}
