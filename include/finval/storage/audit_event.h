#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace finval::storage {

// Event types emitted by the application flows.
namespace audit_events {
inline constexpr std::string_view kSignupRejected = "SignupRejected";
inline constexpr std::string_view kUserCreated = "UserCreated";
inline constexpr std::string_view kAccountCreationRejected = "AccountCreationRejected";
inline constexpr std::string_view kAccountCreated = "AccountCreated";
inline constexpr std::string_view kFundingRejected = "FundingRejected";
inline constexpr std::string_view kAccountFunded = "AccountFunded";
inline constexpr std::string_view kStorageFailure = "StorageFailure";
}  // namespace audit_events

// AuditEvent is one link of a per-trace hash chain. The log assigns
// previous_hash and event_hash on append; callers leave them empty.
// payload is a JSON document; it never contains card, account or password material.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;
  std::string previous_hash{};  // NOLINT(readability-identifier-naming)
  std::string event_hash{};     // NOLINT(readability-identifier-naming)
};

}  // namespace finval::storage
