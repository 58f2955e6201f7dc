#include "finval/core/password_hash.h"

#include "finval/core/normalization.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <charconv>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace finval::core {

namespace {

constexpr std::string_view kScheme = "pbkdf2-sha256";
constexpr int kKeyLength = 32;

std::string to_hex(const unsigned char* data, std::size_t length) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < length; ++i) {
    oss << std::setw(2) << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string derive_key_hex(std::string_view password, std::string_view salt, int iterations) {
  std::array<unsigned char, kKeyLength> key{};
  if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                        reinterpret_cast<const unsigned char*>(salt.data()),
                        static_cast<int>(salt.size()), iterations, EVP_sha256(), kKeyLength,
                        key.data()) != 1) {
    throw std::runtime_error("PBKDF2 key derivation failed");
  }
  return to_hex(key.data(), key.size());
}

}  // namespace

std::string hash_password(std::string_view password, std::string_view salt, int iterations) {
  const int effective_iterations = iterations < 1 ? 1 : iterations;
  return std::string(kScheme) + "$" + std::to_string(effective_iterations) + "$" +
         std::string(salt) + "$" + derive_key_hex(password, salt, effective_iterations);
}

bool verify_password(std::string_view password, std::string_view encoded) {
  // scheme$iterations$salt$key
  const auto p1 = encoded.find('$');
  if (p1 == std::string_view::npos || encoded.substr(0, p1) != kScheme) {
    return false;
  }
  const auto p2 = encoded.find('$', p1 + 1);
  if (p2 == std::string_view::npos) {
    return false;
  }
  const auto p3 = encoded.find('$', p2 + 1);
  if (p3 == std::string_view::npos) {
    return false;
  }

  const std::string_view iterations_text = encoded.substr(p1 + 1, p2 - p1 - 1);
  if (!all_ascii_digits(iterations_text)) {
    return false;
  }
  int iterations = 0;
  const auto [ptr, ec] = std::from_chars(
      iterations_text.data(), iterations_text.data() + iterations_text.size(), iterations);
  if (ec != std::errc{} || iterations < 1) {
    return false;
  }

  const std::string_view salt = encoded.substr(p2 + 1, p3 - p2 - 1);
  const std::string_view stored = encoded.substr(p3 + 1);
  if (stored.size() != static_cast<std::size_t>(kKeyLength) * 2) {
    return false;
  }
  const std::string computed = derive_key_hex(password, salt, iterations);
  return CRYPTO_memcmp(computed.data(), stored.data(), stored.size()) == 0;
}

std::string RandomSaltSource::next_salt() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("failed to generate random salt");
  }
  return to_hex(bytes.data(), bytes.size());
}

}  // namespace finval::core
