#pragma once

#include "finval/storage/audit_event.h"
#include "finval/storage/audit_log.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace finval::storage {

// previous_hash of the first event of every trace.
inline constexpr std::string_view kGenesisHash =
    "0000000000000000000000000000000000000000000000000000000000000000";

// chain_digest = hex(SHA-256(canonical_json(event without hash fields) || previous_hash)).
// canonical_json has sorted keys and no whitespace.
[[nodiscard]] std::string chain_digest(const AuditEvent& event, std::string_view previous_hash);

struct ChainCheck {
  bool intact{false};       // NOLINT(readability-identifier-naming)
  std::size_t broken_at{};  // NOLINT(readability-identifier-naming)
  std::string reason;       // NOLINT(readability-identifier-naming)
};

// verify_chain walks one trace in append order.
// intact: broken_at == events.size(). Broken: broken_at is the first bad link.
[[nodiscard]] ChainCheck verify_chain(const std::vector<AuditEvent>& events);

struct BrokenTrace {
  std::string trace_id;  // NOLINT(readability-identifier-naming)
  ChainCheck check;      // NOLINT(readability-identifier-naming)
};

// Verifies every trace in the log; returns only the broken ones, in trace_id order.
[[nodiscard]] std::vector<BrokenTrace> find_broken_traces(const IAuditLog& log);

}  // namespace finval::storage
