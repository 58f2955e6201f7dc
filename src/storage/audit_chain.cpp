#include "finval/storage/audit_chain.h"

#include "finval/core/sha256.h"

#include <nlohmann/json.hpp>

namespace finval::storage {

std::string chain_digest(const AuditEvent& event, const std::string_view previous_hash) {
  // nlohmann::json objects are std::map backed, so dump() emits keys in sorted order.
  const nlohmann::json canonical = {
      {"created_at", event.created_at}, {"event_id", event.event_id},
      {"event_type", event.event_type}, {"payload", event.payload},
      {"refs", event.refs},             {"trace_id", event.trace_id},
  };

  core::Sha256 hasher;
  hasher.update(canonical.dump());
  hasher.update(previous_hash);
  return core::to_hex(hasher.finish());
}

ChainCheck verify_chain(const std::vector<AuditEvent>& events) {
  std::string_view expected_previous = kGenesisHash;

  for (std::size_t i = 0; i < events.size(); ++i) {
    const AuditEvent& link = events[i];
    if (link.previous_hash != expected_previous) {
      return {false, i, "previous_hash does not match the preceding event at index " +
                            std::to_string(i)};
    }
    if (link.event_hash != chain_digest(link, link.previous_hash)) {
      return {false, i, "event_hash does not match event contents at index " +
                            std::to_string(i)};
    }
    expected_previous = link.event_hash;
  }

  return {true, events.size(), ""};
}

std::vector<BrokenTrace> find_broken_traces(const IAuditLog& log) {
  std::vector<BrokenTrace> broken;
  for (const auto& trace_id : log.list_trace_ids()) {
    auto check = verify_chain(log.query(trace_id));
    if (!check.intact) {
      broken.push_back(BrokenTrace{trace_id, std::move(check)});
    }
  }
  return broken;
}

}  // namespace finval::storage
