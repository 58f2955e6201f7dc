#include "finval/app/app_service.h"
#include "finval/core/clock.h"
#include "finval/core/id_generator.h"
#include "finval/core/services.h"
#include "finval/storage/audit_log.h"
#include "finval/storage/inmemory_account_repository.h"
#include "finval/storage/inmemory_user_repository.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace finval;
using domain::FundingSourceType;

namespace {

// Delegates to an in-memory repository; individual reads and writes can be made
// to fail to exercise the flow's confirmation handling.
class FaultyAccountRepository final : public storage::IAccountRepository {
 public:
  bool fail_deposit{false};
  bool hide_transactions{false};

  core::Result<domain::Account, core::StorageError> insert(const domain::Account& draft) override {
    return inner_.insert(draft);
  }
  [[nodiscard]] std::optional<domain::Account> get(const core::AccountId& id) const override {
    return inner_.get(id);
  }
  [[nodiscard]] std::optional<domain::Account> find_by_user_and_type(
      const core::UserId& user_id, domain::AccountType type) const override {
    return inner_.find_by_user_and_type(user_id, type);
  }
  [[nodiscard]] std::vector<domain::Account> list_by_user(
      const core::UserId& user_id) const override {
    return inner_.list_by_user(user_id);
  }
  core::Result<domain::Account, core::StorageError> set_status(
      const core::AccountId& id, domain::AccountStatus status) override {
    return inner_.set_status(id, status);
  }
  core::Result<domain::Transaction, core::StorageError> record_deposit(
      const domain::Transaction& deposit) override {
    if (fail_deposit) {
      return core::Result<domain::Transaction, core::StorageError>::err(
          core::StorageError::kUnavailable);
    }
    return inner_.record_deposit(deposit);
  }
  [[nodiscard]] std::optional<domain::Transaction> get_transaction(
      const core::TransactionId& id) const override {
    if (hide_transactions) {
      return std::nullopt;
    }
    return inner_.get_transaction(id);
  }
  [[nodiscard]] std::vector<domain::Transaction> list_transactions(
      const core::AccountId& account_id) const override {
    return inner_.list_transactions(account_id);
  }

 private:
  storage::InMemoryAccountRepository inner_;
};

struct FundingFixture {
  storage::InMemoryUserRepository users;
  FaultyAccountRepository accounts;
  storage::InMemoryAuditLog audit_log;
  core::Services services{users, accounts, audit_log};
  core::DeterministicIdGenerator id_gen;
  core::SteppingClock clock{1767225600};

  core::UserId user_id;
  core::AccountId account_id;

  FundingFixture() {
    domain::User user;
    user.user_id = core::new_user_id(id_gen);
    user.email = "funder@example.com";
    REQUIRE(users.insert(user).has_value());
    user_id = user.user_id;

    auto created = app::run_create_account({user_id, domain::AccountType::kChecking, std::nullopt},
                                           services, id_gen, clock);
    REQUIRE(created.has_value());
    account_id = created.value().account.account_id;
  }

  app::FundingRequest card(validation::AmountInput amount, std::string number) const {
    return {user_id, account_id, std::move(amount),
            domain::FundingSource{FundingSourceType::kCard, std::move(number), std::nullopt},
            std::nullopt};
  }

  app::FundingRequest bank(validation::AmountInput amount, std::optional<std::string> routing,
                           std::string number) const {
    return {user_id, account_id, std::move(amount),
            domain::FundingSource{FundingSourceType::kBank, std::move(number), std::move(routing)},
            std::nullopt};
  }

  core::Cents balance() const { return accounts.get(account_id)->balance_cents; }
};

}  // namespace

// ── success ─────────────────────────────────────────────────────────────────

TEST_CASE("run_fund_account: card deposit uses the normalized amount", "[funding]") {
  FundingFixture f;
  auto outcome = app::run_fund_account(f.card(std::string{"25.5"}, "4111111111111111"),
                                       f.services, f.id_gen, f.clock);
  REQUIRE(outcome.has_value());

  const auto& funded = outcome.value();
  CHECK(funded.amount.formatted == "25.50");
  CHECK(funded.amount.cents == 2550);
  CHECK(funded.transaction.amount_cents == 2550);
  CHECK(funded.transaction.description == "Funding from card");
  CHECK(funded.transaction.type == "deposit");
  CHECK(funded.transaction.status == "completed");
  CHECK(funded.new_balance_cents == 2550);
  CHECK(f.balance() == 2550);
}

TEST_CASE("run_fund_account: bank deposit with numeric amount", "[funding]") {
  FundingFixture f;
  auto outcome = app::run_fund_account(f.bank(100.0, "021000021", "000123456789"), f.services,
                                       f.id_gen, f.clock);
  REQUIRE(outcome.has_value());
  CHECK(outcome.value().transaction.description == "Funding from bank");
  CHECK(outcome.value().new_balance_cents == 10000);
}

TEST_CASE("run_fund_account: balances accumulate and listing is newest first", "[funding]") {
  FundingFixture f;
  REQUIRE(app::run_fund_account(f.card(std::string{"10"}, "4111111111111111"), f.services,
                                 f.id_gen, f.clock)
              .has_value());
  auto second = app::run_fund_account(f.card(std::string{"0.99"}, "5555555555554444"),
                                      f.services, f.id_gen, f.clock);
  REQUIRE(second.has_value());
  CHECK(second.value().new_balance_cents == 1099);

  auto listing = app::list_transactions(f.user_id, f.account_id, f.services);
  REQUIRE(listing.has_value());
  REQUIRE(listing.value().size() == 2);
  CHECK(listing.value()[0].transaction.amount_cents == 99);
  CHECK(listing.value()[1].transaction.amount_cents == 1000);
  CHECK(listing.value()[0].account_type == domain::AccountType::kChecking);
}

TEST_CASE("run_fund_account: card digits never reach the audit log", "[funding][audit]") {
  FundingFixture f;
  auto req = f.card(std::string{"10"}, "4111111111111111");
  req.trace_id = "trace-fund";
  REQUIRE(app::run_fund_account(req, f.services, f.id_gen, f.clock).has_value());

  const auto events = f.audit_log.query("trace-fund");
  REQUIRE(events.size() == 1);
  CHECK(events[0].event_type == storage::audit_events::kAccountFunded);
  CHECK(events[0].payload.find("4111111111111111") == std::string::npos);
}

// ── gate ────────────────────────────────────────────────────────────────────

// The gate covers ledger rows (users, accounts, transactions). Rejections are
// still recorded as FundingRejected audit events.
TEST_CASE("run_fund_account: invalid input leaves no row and no balance change",
          "[funding][gate]") {
  FundingFixture f;
  const auto events_before = f.audit_log.query("").size();

  SECTION("bad card checksum") {
    auto outcome = app::run_fund_account(f.card(std::string{"10"}, "4111111111111112"),
                                         f.services, f.id_gen, f.clock);
    REQUIRE_FALSE(outcome.has_value());
    CHECK(outcome.error().kind == app::FlowErrorKind::kValidation);
    CHECK(outcome.error().message == "Invalid card number. Please check and try again");
  }

  SECTION("amount over the maximum") {
    auto outcome = app::run_fund_account(f.card(std::string{"10000.01"}, "4111111111111111"),
                                         f.services, f.id_gen, f.clock);
    REQUIRE_FALSE(outcome.has_value());
    CHECK(outcome.error().message == "Amount cannot exceed the maximum of $10,000.00");
  }

  SECTION("bank without routing number") {
    auto outcome = app::run_fund_account(f.bank(std::string{"10"}, std::nullopt, "12345"),
                                         f.services, f.id_gen, f.clock);
    REQUIRE_FALSE(outcome.has_value());
    CHECK(outcome.error().message == "Routing number is required for bank transfers");
  }

  SECTION("bank account number with letters") {
    auto outcome = app::run_fund_account(f.bank(std::string{"10"}, "021000021", "12AB"),
                                         f.services, f.id_gen, f.clock);
    REQUIRE_FALSE(outcome.has_value());
    CHECK(outcome.error().message == "Bank account number must contain only digits");
  }

  CHECK(f.balance() == 0);
  CHECK(f.accounts.list_transactions(f.account_id).empty());

  const auto accounts = f.accounts.list_by_user(f.user_id);
  REQUIRE(accounts.size() == 1);
  CHECK(accounts[0].status == domain::AccountStatus::kActive);
  CHECK(f.users.get(f.user_id).has_value());

  const auto events = f.audit_log.query("");
  REQUIRE(events.size() == events_before + 1);
  CHECK(events.back().event_type == storage::audit_events::kFundingRejected);
}

TEST_CASE("validate_funding: reports amount and source findings together", "[funding][gate]") {
  FundingFixture f;
  const auto report = app::validate_funding(f.bank(std::string{"abc"}, "021000022", ""));
  REQUIRE(report.findings().size() == 3);
  CHECK(report.findings()[0].field == "amount");
  CHECK(report.findings()[1].field == "funding_source.routing_number");
  CHECK(report.findings()[2].field == "funding_source.account_number");
  for (const auto& finding : report.findings()) {
    CHECK_FALSE(finding.valid);
  }
}

// ── ownership and status ────────────────────────────────────────────────────

TEST_CASE("run_fund_account: foreign or unknown account is not found", "[funding]") {
  FundingFixture f;
  auto req = f.card(std::string{"10"}, "4111111111111111");
  req.user_id = core::UserId{"user-someone-else"};
  auto outcome = app::run_fund_account(req, f.services, f.id_gen, f.clock);
  REQUIRE_FALSE(outcome.has_value());
  CHECK(outcome.error().kind == app::FlowErrorKind::kNotFound);
  CHECK(outcome.error().message == "Account not found");

  auto listing = app::list_transactions(req.user_id, f.account_id, f.services);
  CHECK_FALSE(listing.has_value());
}

TEST_CASE("run_fund_account: inactive account is rejected", "[funding]") {
  FundingFixture f;
  REQUIRE(f.accounts.set_status(f.account_id, domain::AccountStatus::kInactive).has_value());
  auto outcome = app::run_fund_account(f.card(std::string{"10"}, "4111111111111111"),
                                       f.services, f.id_gen, f.clock);
  REQUIRE_FALSE(outcome.has_value());
  CHECK(outcome.error().kind == app::FlowErrorKind::kInactive);
  CHECK(f.balance() == 0);
}

// ── storage failures ────────────────────────────────────────────────────────

TEST_CASE("run_fund_account: failed deposit write is a storage failure", "[funding]") {
  FundingFixture f;
  f.accounts.fail_deposit = true;
  auto outcome = app::run_fund_account(f.card(std::string{"10"}, "4111111111111111"),
                                       f.services, f.id_gen, f.clock);
  REQUIRE_FALSE(outcome.has_value());
  CHECK(outcome.error().kind == app::FlowErrorKind::kStorage);
  CHECK(outcome.error().message == "Deposit could not be recorded. Please try again.");
  CHECK(f.balance() == 0);
}

TEST_CASE("run_fund_account: unconfirmed deposit never reports a balance", "[funding]") {
  FundingFixture f;
  f.accounts.hide_transactions = true;
  auto req = f.card(std::string{"10"}, "4111111111111111");
  req.trace_id = "trace-unconfirmed";
  auto outcome = app::run_fund_account(req, f.services, f.id_gen, f.clock);
  REQUIRE_FALSE(outcome.has_value());
  CHECK(outcome.error().kind == app::FlowErrorKind::kStorage);
  CHECK(outcome.error().message ==
        "Deposit was recorded but could not be confirmed. Please refresh and try again.");

  const auto events = f.audit_log.query("trace-unconfirmed");
  REQUIRE(events.size() == 1);
  CHECK(events[0].event_type == storage::audit_events::kStorageFailure);
}
