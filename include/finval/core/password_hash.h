#pragma once

#include <string>
#include <string_view>

namespace finval::core {

// PBKDF2-HMAC-SHA256 password hashing (OpenSSL).
//
// Encoded form: "pbkdf2-sha256$<iterations>$<salt>$<hex derived key>".
// The salt text is fed to PBKDF2 as-is; the derived key is 32 bytes.
// Only the encoded form is ever persisted; the password itself never leaves the flow.
inline constexpr int kDefaultPasswordHashIterations = 310000;

// Throws std::runtime_error if OpenSSL fails to derive the key.
[[nodiscard]] std::string hash_password(std::string_view password, std::string_view salt,
                                        int iterations = kDefaultPasswordHashIterations);

// verify_password re-derives the key using the iterations and salt stored in encoded.
// Returns false for malformed encodings; throws like hash_password if OpenSSL fails.
[[nodiscard]] bool verify_password(std::string_view password, std::string_view encoded);

// Source of per-user salts. Injected like IClock so tests stay deterministic.
class ISaltSource {
 public:
  virtual ~ISaltSource() = default;

  // Contract: returns a non-empty string without '$'.
  virtual std::string next_salt() = 0;

 protected:
  ISaltSource() = default;
  ISaltSource(const ISaltSource&) = default;
  ISaltSource& operator=(const ISaltSource&) = default;
  ISaltSource(ISaltSource&&) = default;
  ISaltSource& operator=(ISaltSource&&) = default;
};

// 16 bytes from OpenSSL RAND_bytes rendered as 32 hex characters.
// Throws std::runtime_error if the generator fails.
class RandomSaltSource final : public ISaltSource {
 public:
  std::string next_salt() override;
};

class FixedSaltSource final : public ISaltSource {
 public:
  explicit FixedSaltSource(std::string salt) : salt_(std::move(salt)) {}
  std::string next_salt() override { return salt_; }

 private:
  std::string salt_;
};

}  // namespace finval::core
