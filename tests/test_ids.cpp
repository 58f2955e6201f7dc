#include "finval/core/clock.h"
#include "finval/core/id_generator.h"
#include "finval/core/ids.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace finval::core;

// ── id generators ───────────────────────────────────────────────────────────

TEST_CASE("DeterministicIdGenerator: one counter across prefixes", "[ids]") {
  DeterministicIdGenerator gen;
  CHECK(gen.next("user") == "user-000001");
  CHECK(gen.next("acct") == "acct-000002");
  CHECK(gen.next("user") == "user-000003");
  CHECK(gen.next(id_prefix::kAuditEvent) == "evt-000004");
}

TEST_CASE("DeterministicIdGenerator: same call sequence, same ids", "[ids]") {
  DeterministicIdGenerator a;
  DeterministicIdGenerator b;
  CHECK(new_user_id(a) == new_user_id(b));
  CHECK(new_account_id(a) == new_account_id(b));
  CHECK(new_transaction_id(a).value == "txn-000003");
  CHECK(new_trace_id(b).value == "trace-000003");
}

TEST_CASE("SystemIdGenerator: ids are prefixed and increase", "[ids]") {
  SystemIdGenerator gen;
  const auto first = gen.next("evt");
  const auto second = gen.next("evt");
  CHECK(first.rfind("evt-", 0) == 0);
  CHECK(first != second);
  CHECK(first < second);
}

TEST_CASE("SystemIdGenerator: timestamp then sequence", "[ids]") {
  SystemIdGenerator gen;
  const auto id = gen.next(id_prefix::kTransaction);
  // "txn-" + 17-digit timestamp + "-" + 6-digit sequence
  REQUIRE(id.size() == 4 + 17 + 1 + 6);
  CHECK(id.rfind("txn-", 0) == 0);
  CHECK(id[21] == '-');
  CHECK(id.substr(22) == "000000");
}

TEST_CASE("strong ids compare by value", "[ids]") {
  CHECK(UserId{"user-000001"} == UserId{"user-000001"});
  CHECK(AccountId{"acct-000001"} < AccountId{"acct-000002"});
}

// ── clocks ──────────────────────────────────────────────────────────────────

TEST_CASE("format_epoch_iso8601", "[clock]") {
  CHECK(format_epoch_iso8601(0) == "1970-01-01T00:00:00Z");
  CHECK(format_epoch_iso8601(1767225600) == "2026-01-01T00:00:00Z");
}

TEST_CASE("SteppingClock advances one second per call", "[clock]") {
  SteppingClock clock(1767225600);
  CHECK(clock.now_iso8601() == "2026-01-01T00:00:00Z");
  CHECK(clock.now_iso8601() == "2026-01-01T00:00:01Z");
  CHECK(clock.now_iso8601() == "2026-01-01T00:00:02Z");
}

TEST_CASE("FixedClock never moves", "[clock]") {
  FixedClock clock("2026-01-01T00:00:00Z");
  CHECK(clock.now_iso8601() == clock.now_iso8601());
}

TEST_CASE("SystemClock renders UTC ISO 8601", "[clock]") {
  SystemClock clock;
  const auto now = clock.now_iso8601();
  REQUIRE(now.size() == 20);
  CHECK(now[10] == 'T');
  CHECK(now.back() == 'Z');
}
