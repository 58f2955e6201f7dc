#pragma once

#ifdef FINVAL_TRANSPORT_BOUNDARY_GUARD
#error "Concrete storage header included in a guarded translation unit; use interfaces only."
#endif

#include "finval/storage/audit_log.h"
#include "finval/storage/sqlite/sqlite_db.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace finval::storage::sqlite {

// SqliteAuditLog persists the hash-chained audit log in audit_events.
// Per-trace order is the idx column; the chain tail is read back from the
// table on every append, so a restarted process continues existing chains.
// append() throws std::runtime_error when the row cannot be written.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  AuditEvent append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  struct ChainTail {
    std::int64_t next_idx{0};
    std::string last_hash;
  };

  [[nodiscard]] ChainTail read_tail(const std::string& trace_id) const;

  std::shared_ptr<SqliteDb> db_;
  std::mutex append_mutex_;
};

}  // namespace finval::storage::sqlite
