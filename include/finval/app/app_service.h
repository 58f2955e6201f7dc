#pragma once

#include "finval/core/clock.h"
#include "finval/core/id_generator.h"
#include "finval/core/ids.h"
#include "finval/core/password_hash.h"
#include "finval/core/result.h"
#include "finval/core/services.h"
#include "finval/domain/account.h"
#include "finval/domain/funding_source.h"
#include "finval/domain/transaction.h"
#include "finval/domain/user.h"
#include "finval/storage/audit_event.h"
#include "finval/validation/amount.h"
#include "finval/validation/field_rules.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace finval::app {

// Every flow validates all of its inputs first and performs at most one
// persisted mutation, only when every finding is valid.

enum class FlowErrorKind {
  kValidation,  // one or more findings invalid; nothing written
  kConflict,    // duplicate email / second account of a type
  kNotFound,    // unknown or foreign user / account
  kInactive,    // account exists but does not accept funds
  kStorage,     // write failed or could not be confirmed by read-back
};

[[nodiscard]] std::string_view flow_error_kind_name(FlowErrorKind kind) noexcept;

struct FlowFailure {
  FlowErrorKind kind{FlowErrorKind::kValidation};      // NOLINT(readability-identifier-naming)
  std::string message;                                 // NOLINT(readability-identifier-naming)
  std::vector<validation::FieldFinding> findings;      // NOLINT(readability-identifier-naming)
};

template <typename T>
using FlowResult = core::Result<T, FlowFailure>;

// ────────────────────────────────────────────────────────────────
// Signup
// ────────────────────────────────────────────────────────────────

struct SignupRequest {
  std::optional<std::string> email;          // NOLINT(readability-identifier-naming)
  std::optional<std::string> password;       // NOLINT(readability-identifier-naming)
  std::optional<std::string> first_name;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> last_name;      // NOLINT(readability-identifier-naming)
  std::optional<std::string> phone_number;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> date_of_birth;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> address;        // NOLINT(readability-identifier-naming)
  std::optional<std::string> city;           // NOLINT(readability-identifier-naming)
  std::optional<std::string> state;          // NOLINT(readability-identifier-naming)
  std::optional<std::string> zip_code;       // NOLINT(readability-identifier-naming)

  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

struct SignupResponse {
  std::string trace_id;  // NOLINT(readability-identifier-naming)
  domain::User user;     // NOLINT(readability-identifier-naming)
};

// Collects a finding for every form field, in signup_field_keys() order.
[[nodiscard]] validation::GateReport validate_signup(const SignupRequest& req);

// Validates every field, rejects a duplicate email, hashes the password and stores
// the user with canonical phone/state/email. The stored row is read back before
// success is reported.
// Emits audit events: SignupRejected or UserCreated.
[[nodiscard]] FlowResult<SignupResponse> run_signup(const SignupRequest& req,
                                                    core::Services& services,
                                                    core::IIdGenerator& id_gen,
                                                    core::IClock& clock,
                                                    core::ISaltSource& salts);

// ────────────────────────────────────────────────────────────────
// Accounts
// ────────────────────────────────────────────────────────────────

struct CreateAccountRequest {
  core::UserId user_id;                                    // NOLINT(readability-identifier-naming)
  domain::AccountType account_type{domain::AccountType::kChecking};  // NOLINT
  std::optional<std::string> trace_id;                     // NOLINT(readability-identifier-naming)
};

struct CreateAccountResponse {
  std::string trace_id;     // NOLINT(readability-identifier-naming)
  domain::Account account;  // NOLINT(readability-identifier-naming)
};

// One account per type per user; starts active with a zero balance.
// Emits audit events: AccountCreationRejected or AccountCreated.
[[nodiscard]] FlowResult<CreateAccountResponse> run_create_account(
    const CreateAccountRequest& req, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock);

[[nodiscard]] std::vector<domain::Account> list_accounts(const core::UserId& user_id,
                                                         core::Services& services);

// ────────────────────────────────────────────────────────────────
// Funding
// ────────────────────────────────────────────────────────────────

struct FundingRequest {
  core::UserId user_id;              // NOLINT(readability-identifier-naming)
  core::AccountId account_id;        // NOLINT(readability-identifier-naming)
  validation::AmountInput amount;    // NOLINT(readability-identifier-naming)
  domain::FundingSource source;      // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

struct FundingResponse {
  std::string trace_id;              // NOLINT(readability-identifier-naming)
  domain::Transaction transaction;   // NOLINT(readability-identifier-naming)
  validation::Amount amount;         // NOLINT(readability-identifier-naming)
  core::Cents new_balance_cents{0};  // NOLINT(readability-identifier-naming)
};

// Findings for "amount" and the funding source ("funding_source.account_number",
// "funding_source.routing_number"). A card source is checked by the card
// validator; a bank source needs a valid routing number and a digits-only
// account number.
[[nodiscard]] validation::GateReport validate_funding(const FundingRequest& req);

// Bank account numbers are never stored; only their shape is checked.
// Reported under "funding_source.account_number".
[[nodiscard]] validation::FieldFinding validate_bank_account_number(std::string_view raw);

// Gate, ownership, active status, one atomic deposit, confirmation read.
// The amount is normalized once; that value is written and returned.
// Emits audit events: FundingRejected or AccountFunded.
[[nodiscard]] FlowResult<FundingResponse> run_fund_account(const FundingRequest& req,
                                                           core::Services& services,
                                                           core::IIdGenerator& id_gen,
                                                           core::IClock& clock);

struct TransactionView {
  domain::Transaction transaction;  // NOLINT(readability-identifier-naming)
  domain::AccountType account_type{domain::AccountType::kChecking};  // NOLINT
};

// Newest first. kNotFound unless the account belongs to user_id.
[[nodiscard]] FlowResult<std::vector<TransactionView>> list_transactions(
    const core::UserId& user_id, const core::AccountId& account_id, core::Services& services);

// ────────────────────────────────────────────────────────────────
// Audit Trace
// ────────────────────────────────────────────────────────────────

[[nodiscard]] std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                                 core::Services& services);

}  // namespace finval::app
