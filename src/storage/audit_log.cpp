#include "finval/storage/audit_log.h"

#include "finval/storage/audit_chain.h"

#include <algorithm>
#include <iterator>

namespace finval::storage {

AuditEvent InMemoryAuditLog::append(const AuditEvent& event) {
  const auto tail = chain_tail_.try_emplace(event.trace_id, kGenesisHash).first;

  AuditEvent stored = event;
  stored.previous_hash = tail->second;
  stored.event_hash = chain_digest(stored, stored.previous_hash);
  tail->second = stored.event_hash;

  events_.push_back(stored);
  return stored;
}

std::vector<AuditEvent> InMemoryAuditLog::query(const std::string& trace_id) const {
  if (trace_id.empty()) {
    return events_;
  }
  std::vector<AuditEvent> matching;
  std::copy_if(events_.begin(), events_.end(), std::back_inserter(matching),
               [&trace_id](const AuditEvent& e) { return e.trace_id == trace_id; });
  return matching;
}

std::vector<std::string> InMemoryAuditLog::list_trace_ids() const {
  std::vector<std::string> ids;
  ids.reserve(chain_tail_.size());
  for (const auto& [trace_id, last_hash] : chain_tail_) {
    ids.push_back(trace_id);
  }
  return ids;
}

}  // namespace finval::storage
