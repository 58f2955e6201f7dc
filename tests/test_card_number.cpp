#include "finval/validation/card_number.h"

#include <catch2/catch_test_macros.hpp>

using namespace finval;
using validation::CardNetwork;
using validation::ErrorCode;

// ── Luhn ────────────────────────────────────────────────────────────────────

TEST_CASE("luhn_check: known numbers", "[card]") {
  CHECK(validation::luhn_check("4111111111111111"));
  CHECK(validation::luhn_check("5555555555554444"));
  CHECK(validation::luhn_check("378282246310005"));
  CHECK(validation::luhn_check("6011111111111117"));
  CHECK_FALSE(validation::luhn_check("4111111111111112"));
  CHECK_FALSE(validation::luhn_check(""));
  CHECK_FALSE(validation::luhn_check("4111-1111"));
}

TEST_CASE("luhn_check: any single-digit change is detected", "[card]") {
  const std::string valid = "4111111111111111";
  for (std::size_t i = 0; i < valid.size(); ++i) {
    std::string mutated = valid;
    mutated[i] = mutated[i] == '9' ? '0' : static_cast<char>(mutated[i] + 1);
    INFO("position " << i);
    CHECK_FALSE(validation::luhn_check(mutated));
  }
}

// ── network detection ───────────────────────────────────────────────────────

TEST_CASE("detect_card_network: prefixes and lengths", "[card]") {
  CHECK(validation::detect_card_network("4000000000000002") == CardNetwork::kVisa);
  CHECK(validation::detect_card_network("5100000000000008") == CardNetwork::kMastercard);
  CHECK(validation::detect_card_network("5500000000000004") == CardNetwork::kMastercard);
  CHECK(validation::detect_card_network("2221000000000009") == CardNetwork::kMastercard);
  CHECK(validation::detect_card_network("2720000000000005") == CardNetwork::kMastercard);
  CHECK(validation::detect_card_network("340000000000009") == CardNetwork::kAmex);
  CHECK(validation::detect_card_network("370000000000002") == CardNetwork::kAmex);
  CHECK(validation::detect_card_network("6011111111111117") == CardNetwork::kDiscover);
  CHECK(validation::detect_card_network("6440000000000005") == CardNetwork::kDiscover);
  CHECK(validation::detect_card_network("6500000000000002") == CardNetwork::kDiscover);
  CHECK(validation::detect_card_network("6282000000000006") == CardNetwork::kDiscover);

  CHECK(validation::detect_card_network("5600000000000003") == CardNetwork::kUnsupported);
  CHECK(validation::detect_card_network("2721000000000004") == CardNetwork::kUnsupported);
  // Amex prefix with a 16-digit length.
  CHECK(validation::detect_card_network("3400000000000009") == CardNetwork::kUnsupported);
}

TEST_CASE("detect_card_network: Discover co-branded range boundaries", "[card]") {
  CHECK(validation::detect_card_network("6221250000000001") == CardNetwork::kUnsupported);
  CHECK(validation::detect_card_network("6221260000000000") == CardNetwork::kDiscover);
  CHECK(validation::detect_card_network("6229250000000003") == CardNetwork::kDiscover);
  CHECK(validation::detect_card_network("6229260000000002") == CardNetwork::kUnsupported);
}

// ── validate_card_number ────────────────────────────────────────────────────

TEST_CASE("validate_card_number: accepted cards report the network only", "[card]") {
  const auto visa = validation::validate_card_number("4111111111111111");
  REQUIRE(visa.valid());
  CHECK(visa.normalized()->network == CardNetwork::kVisa);
  CHECK(visa.normalized()->length_class == 16);

  const auto amex = validation::validate_card_number("378282246310005");
  REQUIRE(amex.valid());
  CHECK(amex.normalized()->network == CardNetwork::kAmex);
  CHECK(amex.normalized()->length_class == 15);
  CHECK(validation::card_network_name(amex.normalized()->network) == "American Express");
}

TEST_CASE("validate_card_number: checks run in order", "[card]") {
  CHECK(validation::validate_card_number("").error_code() == ErrorCode::kRequired);
  CHECK(validation::validate_card_number("4111 1111 1111 1111").error_code() ==
        ErrorCode::kFormat);
  CHECK(validation::validate_card_number("4111-1111-1111-1111").error_code() ==
        ErrorCode::kFormat);
  CHECK(validation::validate_card_number("411111111111").error_code() == ErrorCode::kFormat);
  CHECK(validation::validate_card_number("41111111111111111").error_code() ==
        ErrorCode::kFormat);

  // Unsupported network is reported even when the checksum is also wrong.
  const auto unsupported = validation::validate_card_number("6221250000000001");
  CHECK(unsupported.error_code() == ErrorCode::kUnsupported);
  CHECK(unsupported.error_message() ==
        "We accept Visa, Mastercard, American Express, and Discover cards");

  const auto bad_checksum = validation::validate_card_number("4111111111111112");
  CHECK(bad_checksum.error_code() == ErrorCode::kChecksum);
  CHECK(bad_checksum.error_message() == "Invalid card number. Please check and try again");
}
