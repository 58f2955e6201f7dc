#include "finval/app/app_service.h"

#include "finval/app/signup_fields.h"
#include "finval/core/normalization.h"
#include "finval/validation/card_number.h"
#include "finval/validation/routing_number.h"

#include <nlohmann/json.hpp>

#include <array>
#include <utility>

namespace finval::app {

using validation::FieldFinding;
using validation::GateReport;

std::string_view flow_error_kind_name(const FlowErrorKind kind) noexcept {
  switch (kind) {
    case FlowErrorKind::kValidation:
      return "validation";
    case FlowErrorKind::kConflict:
      return "conflict";
    case FlowErrorKind::kNotFound:
      return "not_found";
    case FlowErrorKind::kInactive:
      return "inactive";
    case FlowErrorKind::kStorage:
      return "storage";
  }
  return "storage";
}

namespace {

std::optional<std::string_view> as_view(const std::optional<std::string>& value) {
  if (!value.has_value()) {
    return std::nullopt;
  }
  return std::string_view{*value};
}

std::string resolve_trace_id(const std::optional<std::string>& requested,
                             core::IIdGenerator& id_gen) {
  if (requested.has_value() && !requested->empty()) {
    return *requested;
  }
  return core::new_trace_id(id_gen).value;
}

template <typename T>
FlowResult<T> fail(FlowErrorKind kind, std::string message,
                   std::vector<FieldFinding> findings = {}) {
  return FlowResult<T>::err(FlowFailure{kind, std::move(message), std::move(findings)});
}

// Audit payloads name failing fields and codes only; submitted values never
// enter the log.
nlohmann::json rejected_fields(const GateReport& report) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& finding : report.findings()) {
    if (!finding.valid && finding.error_code.has_value()) {
      out.push_back({{"field", finding.field},
                     {"error_code", std::string{validation::error_code_name(*finding.error_code)}}});
    }
  }
  return out;
}

void record(core::Services& services, core::IIdGenerator& id_gen, core::IClock& clock,
            const std::string& trace_id, std::string_view event_type,
            const nlohmann::json& payload, std::vector<std::string> refs = {}) {
  services.audit_log.append({id_gen.next(core::id_prefix::kAuditEvent), trace_id, std::string{event_type},
                             payload.dump(), clock.now_iso8601(), std::move(refs)});
}

// Runs every funding check and returns the normalized amount when it is valid.
std::optional<validation::Amount> gate_funding(const FundingRequest& req, GateReport& report) {
  const auto amount = validation::validate_amount_input(req.amount);
  report.add(validation::to_finding(
      "amount", amount,
      amount.valid() ? std::optional{amount.normalized()->formatted} : std::nullopt));

  if (req.source.type == domain::FundingSourceType::kCard) {
    const auto card = validation::validate_card_number(req.source.account_number);
    report.add(validation::to_finding(
        "funding_source.account_number", card,
        card.valid()
            ? std::optional{std::string{validation::card_network_name(card.normalized()->network)}}
            : std::nullopt));
  } else {
    const auto routing = validation::validate_routing_number(as_view(req.source.routing_number));
    report.add(
        validation::to_finding("funding_source.routing_number", routing, routing.normalized()));

    report.add(validate_bank_account_number(req.source.account_number));
  }

  if (!amount.valid()) {
    return std::nullopt;
  }
  return amount.normalized();
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Signup
// ────────────────────────────────────────────────────────────────

GateReport validate_signup(const SignupRequest& req) {
  const std::array<const std::optional<std::string>*, 10> values = {
      &req.email,        &req.password,      &req.first_name, &req.last_name,
      &req.phone_number, &req.date_of_birth, &req.address,    &req.city,
      &req.state,        &req.zip_code};
  const auto& keys = signup_field_keys();

  GateReport report;
  for (std::size_t i = 0; i < values.size(); ++i) {
    report.add(validate_signup_field(keys[i], as_view(*values[i])));
  }
  return report;
}

FlowResult<SignupResponse> run_signup(const SignupRequest& req, core::Services& services,
                                      core::IIdGenerator& id_gen, core::IClock& clock,
                                      core::ISaltSource& salts) {
  const std::string trace_id = resolve_trace_id(req.trace_id, id_gen);

  const GateReport report = validate_signup(req);
  if (!report.passed()) {
    record(services, id_gen, clock, trace_id, storage::audit_events::kSignupRejected,
           {{"reason", "validation"}, {"fields", rejected_fields(report)}});
    return fail<SignupResponse>(FlowErrorKind::kValidation, report.first_failure()->message,
                                report.findings());
  }

  const std::string email = report.normalized("email").value_or("");
  if (services.users.find_by_email(email).has_value()) {
    record(services, id_gen, clock, trace_id, storage::audit_events::kSignupRejected,
           {{"reason", "conflict"}});
    return fail<SignupResponse>(FlowErrorKind::kConflict, "User already exists");
  }

  domain::User user;
  user.user_id = core::new_user_id(id_gen);
  user.email = email;
  user.password_hash = core::hash_password(req.password.value_or(""), salts.next_salt());
  user.first_name = report.normalized("first_name").value_or("");
  user.last_name = report.normalized("last_name").value_or("");
  user.phone_number = report.normalized("phone_number").value_or("");
  user.date_of_birth = report.normalized("date_of_birth").value_or("");
  user.address = report.normalized("address").value_or("");
  user.city = report.normalized("city").value_or("");
  user.state = report.normalized("state").value_or("");
  user.zip_code = report.normalized("zip_code").value_or("");
  user.created_at = clock.now_iso8601();

  const auto inserted = services.users.insert(user);
  if (!inserted.has_value()) {
    const bool conflict = inserted.error() == core::StorageError::kConflict;
    record(services, id_gen, clock, trace_id, storage::audit_events::kSignupRejected,
           {{"reason", core::storage_error_name(inserted.error())}});
    return conflict ? fail<SignupResponse>(FlowErrorKind::kConflict, "User already exists")
                    : fail<SignupResponse>(FlowErrorKind::kStorage, "Failed to create user");
  }

  auto confirmed = services.users.get(user.user_id);
  if (!confirmed.has_value()) {
    record(services, id_gen, clock, trace_id, storage::audit_events::kStorageFailure,
           {{"operation", "signup"}, {"user_id", user.user_id.value}}, {user.user_id.value});
    return fail<SignupResponse>(FlowErrorKind::kStorage, "Failed to create user");
  }

  record(services, id_gen, clock, trace_id, storage::audit_events::kUserCreated,
         {{"user_id", confirmed->user_id.value}, {"state", confirmed->state}},
         {confirmed->user_id.value});
  return FlowResult<SignupResponse>::ok(SignupResponse{trace_id, std::move(*confirmed)});
}

// ────────────────────────────────────────────────────────────────
// Accounts
// ────────────────────────────────────────────────────────────────

FlowResult<CreateAccountResponse> run_create_account(const CreateAccountRequest& req,
                                                     core::Services& services,
                                                     core::IIdGenerator& id_gen,
                                                     core::IClock& clock) {
  const std::string trace_id = resolve_trace_id(req.trace_id, id_gen);
  const std::string type_name{domain::account_type_name(req.account_type)};

  if (!services.users.get(req.user_id).has_value()) {
    record(services, id_gen, clock, trace_id, storage::audit_events::kAccountCreationRejected,
           {{"reason", "not_found"}, {"account_type", type_name}}, {req.user_id.value});
    return fail<CreateAccountResponse>(FlowErrorKind::kNotFound, "User not found");
  }

  const std::string duplicate_message = "You already have a " + type_name + " account";
  if (services.accounts.find_by_user_and_type(req.user_id, req.account_type).has_value()) {
    record(services, id_gen, clock, trace_id, storage::audit_events::kAccountCreationRejected,
           {{"reason", "conflict"}, {"account_type", type_name}}, {req.user_id.value});
    return fail<CreateAccountResponse>(FlowErrorKind::kConflict, duplicate_message);
  }

  domain::Account draft;
  draft.account_id = core::new_account_id(id_gen);
  draft.user_id = req.user_id;
  draft.type = req.account_type;
  draft.balance_cents = 0;
  draft.status = domain::AccountStatus::kActive;
  draft.created_at = clock.now_iso8601();

  const auto inserted = services.accounts.insert(draft);
  if (!inserted.has_value()) {
    record(services, id_gen, clock, trace_id, storage::audit_events::kAccountCreationRejected,
           {{"reason", core::storage_error_name(inserted.error())}, {"account_type", type_name}},
           {req.user_id.value});
    if (inserted.error() == core::StorageError::kConflict) {
      return fail<CreateAccountResponse>(FlowErrorKind::kConflict, duplicate_message);
    }
    return fail<CreateAccountResponse>(FlowErrorKind::kStorage, "Failed to create account");
  }

  auto confirmed = services.accounts.get(draft.account_id);
  if (!confirmed.has_value()) {
    record(services, id_gen, clock, trace_id, storage::audit_events::kStorageFailure,
           {{"operation", "create_account"}, {"account_id", draft.account_id.value}},
           {req.user_id.value, draft.account_id.value});
    return fail<CreateAccountResponse>(
        FlowErrorKind::kStorage,
        "Account was created but could not be retrieved. Please refresh and try again.");
  }

  record(services, id_gen, clock, trace_id, storage::audit_events::kAccountCreated,
         {{"account_id", confirmed->account_id.value},
          {"account_type", type_name},
          {"account_number", confirmed->account_number}},
         {req.user_id.value, confirmed->account_id.value});
  return FlowResult<CreateAccountResponse>::ok(
      CreateAccountResponse{trace_id, std::move(*confirmed)});
}

std::vector<domain::Account> list_accounts(const core::UserId& user_id,
                                           core::Services& services) {
  return services.accounts.list_by_user(user_id);
}

// ────────────────────────────────────────────────────────────────
// Funding
// ────────────────────────────────────────────────────────────────

FieldFinding validate_bank_account_number(std::string_view raw) {
  const std::string_view bank_account = core::trim_view(raw);
  if (bank_account.empty()) {
    return validation::rejected_finding("funding_source.account_number",
                                        validation::ErrorCode::kRequired,
                                        "Bank account number is required");
  }
  if (!core::all_ascii_digits(bank_account)) {
    return validation::rejected_finding("funding_source.account_number",
                                        validation::ErrorCode::kFormat,
                                        "Bank account number must contain only digits");
  }
  return validation::accepted_finding("funding_source.account_number", std::nullopt);
}

GateReport validate_funding(const FundingRequest& req) {
  GateReport report;
  static_cast<void>(gate_funding(req, report));
  return report;
}

FlowResult<FundingResponse> run_fund_account(const FundingRequest& req, core::Services& services,
                                             core::IIdGenerator& id_gen, core::IClock& clock) {
  const std::string trace_id = resolve_trace_id(req.trace_id, id_gen);
  const std::vector<std::string> refs = {req.account_id.value};

  GateReport report;
  const auto amount = gate_funding(req, report);
  if (!report.passed() || !amount.has_value()) {
    record(services, id_gen, clock, trace_id, storage::audit_events::kFundingRejected,
           {{"reason", "validation"},
            {"account_id", req.account_id.value},
            {"fields", rejected_fields(report)}},
           refs);
    return fail<FundingResponse>(FlowErrorKind::kValidation, report.first_failure()->message,
                                 report.findings());
  }

  const auto account = services.accounts.get(req.account_id);
  if (!account.has_value() || account->user_id != req.user_id) {
    record(services, id_gen, clock, trace_id, storage::audit_events::kFundingRejected,
           {{"reason", "not_found"}, {"account_id", req.account_id.value}}, refs);
    return fail<FundingResponse>(FlowErrorKind::kNotFound, "Account not found");
  }
  if (!account->is_active()) {
    record(services, id_gen, clock, trace_id, storage::audit_events::kFundingRejected,
           {{"reason", "inactive"}, {"account_id", req.account_id.value}}, refs);
    return fail<FundingResponse>(FlowErrorKind::kInactive, "Account is not active");
  }

  const std::string source_name{domain::funding_source_type_name(req.source.type)};

  domain::Transaction deposit;
  deposit.transaction_id = core::new_transaction_id(id_gen);
  deposit.account_id = req.account_id;
  deposit.type = "deposit";
  deposit.amount_cents = amount->cents;
  deposit.description = "Funding from " + source_name;
  deposit.status = "completed";
  deposit.processed_at = clock.now_iso8601();

  const auto recorded = services.accounts.record_deposit(deposit);
  if (!recorded.has_value()) {
    record(services, id_gen, clock, trace_id, storage::audit_events::kFundingRejected,
           {{"reason", core::storage_error_name(recorded.error())},
            {"account_id", req.account_id.value}},
           refs);
    if (recorded.error() == core::StorageError::kNotFound) {
      return fail<FundingResponse>(FlowErrorKind::kNotFound, "Account not found");
    }
    return fail<FundingResponse>(FlowErrorKind::kStorage,
                                 "Deposit could not be recorded. Please try again.");
  }

  auto confirmed_transaction = services.accounts.get_transaction(deposit.transaction_id);
  const auto confirmed_account = services.accounts.get(req.account_id);
  if (!confirmed_transaction.has_value() || !confirmed_account.has_value()) {
    record(services, id_gen, clock, trace_id, storage::audit_events::kStorageFailure,
           {{"operation", "fund_account"},
            {"account_id", req.account_id.value},
            {"transaction_id", deposit.transaction_id.value}},
           {req.account_id.value, deposit.transaction_id.value});
    return fail<FundingResponse>(
        FlowErrorKind::kStorage,
        "Deposit was recorded but could not be confirmed. Please refresh and try again.");
  }

  record(services, id_gen, clock, trace_id, storage::audit_events::kAccountFunded,
         {{"account_id", req.account_id.value},
          {"transaction_id", deposit.transaction_id.value},
          {"amount_cents", amount->cents},
          {"new_balance_cents", confirmed_account->balance_cents},
          {"source", source_name}},
         {req.account_id.value, deposit.transaction_id.value});

  return FlowResult<FundingResponse>::ok(FundingResponse{trace_id,
                                                         std::move(*confirmed_transaction),
                                                         *amount,
                                                         confirmed_account->balance_cents});
}

FlowResult<std::vector<TransactionView>> list_transactions(const core::UserId& user_id,
                                                           const core::AccountId& account_id,
                                                           core::Services& services) {
  const auto account = services.accounts.get(account_id);
  if (!account.has_value() || account->user_id != user_id) {
    return fail<std::vector<TransactionView>>(FlowErrorKind::kNotFound, "Account not found");
  }

  std::vector<TransactionView> views;
  for (auto& transaction : services.accounts.list_transactions(account_id)) {
    views.push_back(TransactionView{std::move(transaction), account->type});
  }
  return FlowResult<std::vector<TransactionView>>::ok(std::move(views));
}

// ────────────────────────────────────────────────────────────────
// Audit Trace
// ────────────────────────────────────────────────────────────────

std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                   core::Services& services) {
  return services.audit_log.query(trace_id);
}

}  // namespace finval::app
