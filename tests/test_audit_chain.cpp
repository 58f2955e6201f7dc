#include "finval/storage/audit_chain.h"
#include "finval/storage/audit_log.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace finval::storage;

namespace {

AuditEvent event(const std::string& id, const std::string& trace, const std::string& type) {
  return AuditEvent{id, trace, type, R"({"k":"v"})", "2026-01-01T00:00:00Z", {"ref-1"}};
}

}  // namespace

// ── chain_digest ────────────────────────────────────────────────────────────

TEST_CASE("chain_digest: deterministic and sensitive to every input", "[audit_chain]") {
  const auto base = event("evt-1", "trace-1", "UserCreated");
  const auto digest = chain_digest(base, kGenesisHash);

  CHECK(digest.size() == 64);
  CHECK(digest == chain_digest(base, kGenesisHash));

  auto changed_payload = base;
  changed_payload.payload = R"({"k":"w"})";
  CHECK(chain_digest(changed_payload, kGenesisHash) != digest);

  auto changed_refs = base;
  changed_refs.refs.push_back("ref-2");
  CHECK(chain_digest(changed_refs, kGenesisHash) != digest);

  CHECK(chain_digest(base, digest) != digest);
}

TEST_CASE("chain_digest ignores the stored hash fields", "[audit_chain]") {
  auto linked = event("evt-1", "trace-1", "UserCreated");
  const auto digest = chain_digest(linked, kGenesisHash);
  linked.previous_hash = std::string{kGenesisHash};
  linked.event_hash = digest;
  CHECK(chain_digest(linked, kGenesisHash) == digest);
}

// ── in-memory log ───────────────────────────────────────────────────────────

TEST_CASE("InMemoryAuditLog: chains are kept per trace", "[audit_chain]") {
  InMemoryAuditLog log;
  const auto a1 = log.append(event("evt-1", "trace-a", "UserCreated"));
  const auto b1 = log.append(event("evt-2", "trace-b", "UserCreated"));
  const auto a2 = log.append(event("evt-3", "trace-a", "AccountCreated"));

  CHECK(a1.previous_hash == kGenesisHash);
  CHECK(b1.previous_hash == kGenesisHash);
  CHECK(a2.previous_hash == a1.event_hash);

  CHECK(log.query("trace-a").size() == 2);
  CHECK(log.query("").size() == 3);
  CHECK(log.list_trace_ids() == std::vector<std::string>{"trace-a", "trace-b"});
  CHECK(find_broken_traces(log).empty());
}

// ── verify_chain ────────────────────────────────────────────────────────────

TEST_CASE("verify_chain", "[audit_chain]") {
  InMemoryAuditLog log;
  static_cast<void>(log.append(event("evt-1", "trace-1", "UserCreated")));
  static_cast<void>(log.append(event("evt-2", "trace-1", "AccountCreated")));
  static_cast<void>(log.append(event("evt-3", "trace-1", "AccountFunded")));
  auto events = log.query("trace-1");

  SECTION("intact chain") {
    const auto check = verify_chain(events);
    CHECK(check.intact);
    CHECK(check.broken_at == 3);
  }

  SECTION("empty chain is intact") {
    CHECK(verify_chain({}).intact);
  }

  SECTION("edited payload breaks that link") {
    events[1].payload = R"({"k":"tampered"})";
    const auto check = verify_chain(events);
    CHECK_FALSE(check.intact);
    CHECK(check.broken_at == 1);
    CHECK(check.reason.find("event_hash") != std::string::npos);
  }

  SECTION("reordered events break the chain") {
    std::swap(events[1], events[2]);
    const auto check = verify_chain(events);
    CHECK_FALSE(check.intact);
    CHECK(check.broken_at == 1);
    CHECK(check.reason.find("previous_hash") != std::string::npos);
  }

  SECTION("dropped event breaks the chain") {
    events.erase(events.begin());
    const auto check = verify_chain(events);
    CHECK_FALSE(check.intact);
    CHECK(check.broken_at == 0);
  }
}

// ── find_broken_traces ──────────────────────────────────────────────────────

namespace {

// Serves stored events with one trace's payload rewritten.
class TamperedLog final : public IAuditLog {
 public:
  explicit TamperedLog(const InMemoryAuditLog& source, std::string victim)
      : source_(source), victim_(std::move(victim)) {}

  AuditEvent append(const AuditEvent& e) override { return e; }

  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override {
    auto events = source_.query(trace_id);
    for (auto& e : events) {
      if (e.trace_id == victim_) {
        e.payload = "{}";
      }
    }
    return events;
  }

  [[nodiscard]] std::vector<std::string> list_trace_ids() const override {
    return source_.list_trace_ids();
  }

 private:
  const InMemoryAuditLog& source_;
  std::string victim_;
};

}  // namespace

TEST_CASE("find_broken_traces reports only the tampered trace", "[audit_chain]") {
  InMemoryAuditLog log;
  static_cast<void>(log.append(event("evt-1", "trace-a", "UserCreated")));
  static_cast<void>(log.append(event("evt-2", "trace-b", "UserCreated")));
  static_cast<void>(log.append(event("evt-3", "trace-c", "UserCreated")));

  const TamperedLog tampered(log, "trace-b");
  const auto broken = find_broken_traces(tampered);
  REQUIRE(broken.size() == 1);
  CHECK(broken[0].trace_id == "trace-b");
  CHECK(broken[0].check.broken_at == 0);
}
