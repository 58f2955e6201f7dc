#pragma once

#include "finval/storage/audit_event.h"

#include <map>
#include <string>
#include <vector>

namespace finval::storage {

// IAuditLog is append-only. append() links the event into its trace's hash
// chain and returns the stored copy with previous_hash/event_hash filled in.
class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  virtual AuditEvent append(const AuditEvent& event) = 0;
  // Events of one trace in append order; an empty trace_id returns every event.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
  [[nodiscard]] virtual std::vector<std::string> list_trace_ids() const = 0;

 protected:
  IAuditLog() = default;
  IAuditLog(const IAuditLog&) = default;
  IAuditLog& operator=(const IAuditLog&) = default;
  IAuditLog(IAuditLog&&) = default;
  IAuditLog& operator=(IAuditLog&&) = default;
};

class InMemoryAuditLog final : public IAuditLog {
 public:
  AuditEvent append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  std::vector<AuditEvent> events_;
  std::map<std::string, std::string> chain_tail_;  // trace_id -> last event_hash
};

}  // namespace finval::storage
