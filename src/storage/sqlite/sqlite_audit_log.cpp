#include "finval/storage/sqlite/sqlite_audit_log.h"

#include "finval/storage/audit_chain.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include <stdexcept>

namespace finval::storage::sqlite {

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

SqliteAuditLog::ChainTail SqliteAuditLog::read_tail(const std::string& trace_id) const {
  ChainTail tail{0, std::string{kGenesisHash}};

  PreparedStatement stmt(db_->connection(),
                         "SELECT idx, event_hash FROM audit_events WHERE trace_id = ?"
                         " ORDER BY idx DESC LIMIT 1");
  if (!stmt.is_valid()) {
    throw std::runtime_error("audit log unavailable: " + stmt.error());
  }
  stmt.bind_text(1, trace_id);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    tail.next_idx = stmt.column_int64(0) + 1;
    tail.last_hash = stmt.column_text(1);
  }
  return tail;
}

AuditEvent SqliteAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(append_mutex_);

  const ChainTail tail = read_tail(event.trace_id);

  AuditEvent stored = event;
  stored.previous_hash = tail.last_hash;
  stored.event_hash = chain_digest(stored, stored.previous_hash);

  PreparedStatement stmt(db_->connection(), R"(
    INSERT INTO audit_events
      (event_id, trace_id, event_type, payload, created_at, refs_json, idx,
       previous_hash, event_hash)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
  )");
  if (!stmt.is_valid()) {
    throw std::runtime_error("audit log unavailable: " + stmt.error());
  }

  stmt.bind_text(1, stored.event_id);
  stmt.bind_text(2, stored.trace_id);
  stmt.bind_text(3, stored.event_type);
  stmt.bind_text(4, stored.payload);
  stmt.bind_text(5, stored.created_at);
  stmt.bind_text(6, nlohmann::json(stored.refs).dump());
  stmt.bind_int64(7, tail.next_idx);
  stmt.bind_text(8, stored.previous_hash);
  stmt.bind_text(9, stored.event_hash);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw std::runtime_error("audit append failed for event " + stored.event_id + ": " +
                             sqlite3_errmsg(db_->connection()));
  }
  return stored;
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  std::string sql =
      "SELECT event_id, trace_id, event_type, payload, created_at, refs_json,"
      "       previous_hash, event_hash FROM audit_events";
  sql += trace_id.empty() ? " ORDER BY trace_id, idx" : " WHERE trace_id = ? ORDER BY idx";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }
  if (!trace_id.empty()) {
    stmt.bind_text(1, trace_id);
  }

  std::vector<AuditEvent> events;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    AuditEvent event;
    event.event_id = stmt.column_text(0);
    event.trace_id = stmt.column_text(1);
    event.event_type = stmt.column_text(2);
    event.payload = stmt.column_text(3);
    event.created_at = stmt.column_text(4);
    event.refs = nlohmann::json::parse(stmt.column_text(5)).get<std::vector<std::string>>();
    event.previous_hash = stmt.column_text(6);
    event.event_hash = stmt.column_text(7);
    events.push_back(std::move(event));
  }
  return events;
}

std::vector<std::string> SqliteAuditLog::list_trace_ids() const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT DISTINCT trace_id FROM audit_events ORDER BY trace_id");
  if (!stmt.is_valid()) {
    return {};
  }
  std::vector<std::string> ids;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    ids.push_back(stmt.column_text(0));
  }
  return ids;
}

}  // namespace finval::storage::sqlite
