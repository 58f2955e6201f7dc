#pragma once

#include <string>
#include <string_view>

namespace finval::core {

// Deterministic ASCII-only character utilities.
// These functions are locale-independent and produce byte-stable output
// across all platforms and compilers (no std::isdigit / std::toupper, whose
// behavior depends on the global locale and on the signedness of char).

[[nodiscard]] constexpr bool is_ascii_digit(const char ch) noexcept {
  return ch >= '0' && ch <= '9';
}

[[nodiscard]] constexpr bool is_ascii_upper(const char ch) noexcept {
  return ch >= 'A' && ch <= 'Z';
}

[[nodiscard]] constexpr bool is_ascii_lower(const char ch) noexcept {
  return ch >= 'a' && ch <= 'z';
}

[[nodiscard]] constexpr bool is_ascii_alpha(const char ch) noexcept {
  return is_ascii_upper(ch) || is_ascii_lower(ch);
}

[[nodiscard]] constexpr bool is_ascii_space(const char ch) noexcept {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

[[nodiscard]] constexpr char to_ascii_lower(const char ch) noexcept {
  constexpr char kCaseOffset = 'a' - 'A';
  return is_ascii_upper(ch) ? static_cast<char>(ch + kCaseOffset) : ch;
}

[[nodiscard]] constexpr char to_ascii_upper(const char ch) noexcept {
  constexpr char kCaseOffset = 'a' - 'A';
  return is_ascii_lower(ch) ? static_cast<char>(ch - kCaseOffset) : ch;
}

// all_ascii_digits is true only for a non-empty string of 0-9.
[[nodiscard]] constexpr bool all_ascii_digits(const std::string_view input) noexcept {
  if (input.empty()) {
    return false;
  }
  for (const char ch : input) {
    if (!is_ascii_digit(ch)) {
      return false;
    }
  }
  return true;
}

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII characters are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (const char ch : input) {
    result.push_back(to_ascii_lower(ch));
  }
  return result;
}

inline std::string normalize_ascii_upper(const std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (const char ch : input) {
    result.push_back(to_ascii_upper(ch));
  }
  return result;
}

// digits_only keeps 0-9 and drops everything else, preserving order.
inline std::string digits_only(const std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (const char ch : input) {
    if (is_ascii_digit(ch)) {
      result.push_back(ch);
    }
  }
  return result;
}

// trim removes leading and trailing ASCII whitespace.
inline std::string_view trim_view(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return input.substr(start, end - start);
}

inline std::string trim(const std::string_view input) {
  return std::string{trim_view(input)};
}

}  // namespace finval::core
