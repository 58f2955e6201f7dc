#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace finval::core {

using Sha256Digest = std::array<std::uint8_t, 32>;

// Sha256 is an incremental FIPS 180-4 SHA-256 hasher.
// Feed bytes with update() any number of times, then call finish() once.
// After finish() the instance must be reset() before reuse.
class Sha256 {
 public:
  Sha256() { reset(); }

  void reset() noexcept;
  void update(std::string_view bytes) noexcept;
  void update(const Sha256Digest& digest) noexcept;
  [[nodiscard]] Sha256Digest finish() noexcept;

 private:
  void process_block(const std::uint8_t* block) noexcept;

  std::array<std::uint32_t, 8> state_{};
  std::array<std::uint8_t, 64> buffer_{};
  std::size_t buffered_{0};
  std::uint64_t total_bytes_{0};
};

[[nodiscard]] Sha256Digest sha256(std::string_view input);

// Lower-case hex rendering of a digest (64 characters).
[[nodiscard]] std::string to_hex(const Sha256Digest& digest);

// sha256_hex returns the SHA-256 digest of input as a lower-case hex string.
[[nodiscard]] std::string sha256_hex(std::string_view input);

}  // namespace finval::core
