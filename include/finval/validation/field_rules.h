#pragma once

#include "finval/validation/verdict.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace finval::validation {

// Field identifies which validator a raw value is routed to.
enum class Field {
  kAmount,
  kCardNumber,
  kRoutingNumber,
  kPhoneNumber,
  kPassword,
  kStateCode,
};

// Wire name: "amount", "card_number", "routing_number", "phone_number", "password", "state".
[[nodiscard]] std::string_view field_name(Field field) noexcept;
[[nodiscard]] std::optional<Field> parse_field(std::string_view name) noexcept;
[[nodiscard]] const std::vector<Field>& all_fields();

// FieldFinding is the type-erased view of one verdict, used by calling flows to
// collect results for heterogeneous fields and by both entry points to report them.
struct FieldFinding {
  std::string field;
  bool valid = false;
  std::optional<std::string> normalized;
  std::optional<ErrorCode> error_code;
  std::string message;
};

template <typename T>
[[nodiscard]] FieldFinding to_finding(std::string field, const Verdict<T>& verdict,
                                      std::optional<std::string> normalized = std::nullopt) {
  FieldFinding finding;
  finding.field = std::move(field);
  finding.valid = verdict.valid();
  if (verdict.valid()) {
    finding.normalized = std::move(normalized);
  } else {
    finding.error_code = verdict.error_code();
    finding.message = verdict.error_message();
  }
  return finding;
}

[[nodiscard]] FieldFinding accepted_finding(std::string field,
                                            std::optional<std::string> normalized);
[[nodiscard]] FieldFinding rejected_finding(std::string field, ErrorCode code,
                                            std::string message);

// validate_field is the single dispatch shared by the interactive CLI and the
// JSON-RPC server. An absent value is validated as the empty string (kRequired for
// every field except password, which reports its length rule).
//
// The normalized string of a finding is:
//   amount         canonical two-decimal form ("12.50")
//   card_number    network name ("Visa"); the digits are never echoed
//   routing_number the 9-digit number
//   phone_number   "+1XXXXXXXXXX"
//   password       never set
//   state          uppercase code
[[nodiscard]] FieldFinding validate_field(Field field, std::optional<std::string_view> raw);

// GateReport collects every finding of a calling flow before any mutation.
class GateReport {
 public:
  void add(FieldFinding finding) { findings_.push_back(std::move(finding)); }

  [[nodiscard]] bool passed() const noexcept;
  [[nodiscard]] const FieldFinding* first_failure() const noexcept;
  [[nodiscard]] const std::vector<FieldFinding>& findings() const noexcept { return findings_; }

  // Normalized value of an accepted finding, or std::nullopt.
  [[nodiscard]] std::optional<std::string> normalized(std::string_view field) const;

 private:
  std::vector<FieldFinding> findings_;
};

}  // namespace finval::validation
