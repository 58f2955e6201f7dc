#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace finval::validation {

// Error taxonomy shared by every validator.
enum class ErrorCode {
  kFormat,       // wrong character set or length
  kRange,        // numeric value outside allowed bounds
  kChecksum,     // Luhn / ABA arithmetic failure
  kPolicy,       // password complexity or pattern violation
  kUnsupported,  // recognized but disallowed category
  kRequired,     // mandatory field missing
  kLeadingZero,  // amount with superfluous leading zeros
};

// Wire name of an error code ("FORMAT", "RANGE", ...). Stable across releases.
[[nodiscard]] constexpr std::string_view error_code_name(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kFormat:
      return "FORMAT";
    case ErrorCode::kRange:
      return "RANGE";
    case ErrorCode::kChecksum:
      return "CHECKSUM";
    case ErrorCode::kPolicy:
      return "POLICY";
    case ErrorCode::kUnsupported:
      return "UNSUPPORTED";
    case ErrorCode::kRequired:
      return "REQUIRED";
    case ErrorCode::kLeadingZero:
      return "LEADING_ZERO";
  }
  return "FORMAT";
}

// Verdict<T> is the result of one validation call: a pass/fail flag, the canonical
// form on success, and the error detail on failure.
//
// Verdicts are immutable values. A valid verdict always carries a normalized value
// and never an error; an invalid verdict always carries an error and never a value.
template <typename T>
class Verdict {
 public:
  [[nodiscard]] static Verdict accept(T normalized) {
    Verdict v;
    v.normalized_ = std::move(normalized);
    return v;
  }

  [[nodiscard]] static Verdict reject(ErrorCode code, std::string message) {
    Verdict v;
    v.error_code_ = code;
    v.error_message_ = std::move(message);
    return v;
  }

  [[nodiscard]] bool valid() const noexcept { return normalized_.has_value(); }
  [[nodiscard]] const std::optional<T>& normalized() const noexcept { return normalized_; }
  [[nodiscard]] std::optional<ErrorCode> error_code() const noexcept { return error_code_; }

  // Empty when valid.
  [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

 private:
  Verdict() = default;

  std::optional<T> normalized_;
  std::optional<ErrorCode> error_code_;
  std::string error_message_;
};

}  // namespace finval::validation
