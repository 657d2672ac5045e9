#include "takoa/storage/sqlite/sqlite_audit_log.h"

#include "takoa/storage/audit_chain.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include <stdexcept>

namespace takoa::storage::sqlite {

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

SqliteAuditLog::ChainHead& SqliteAuditLog::head_for(const std::string& trace_id) {
  auto it = heads_.find(trace_id);
  if (it != heads_.end()) {
    return it->second;
  }

  ChainHead head{0, std::string(kGenesisHash)};
  PreparedStatement stmt(
      db_->connection(),
      "SELECT idx, event_hash FROM audit_events WHERE trace_id = ? ORDER BY idx DESC LIMIT 1");
  if (!stmt.is_valid()) {
    throw std::runtime_error("audit head lookup failed: " + stmt.error());
  }
  sqlite3_bind_text(stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    head.next_idx = sqlite3_column_int(stmt.get(), 0) + 1;
    head.last_hash = stmt.column_text(1);
  }
  return heads_.emplace(trace_id, std::move(head)).first->second;
}

void SqliteAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  ChainHead& head = head_for(event.trace_id);

  const std::string event_hash = compute_event_hash(event, head.last_hash);
  const std::string refs = nlohmann::json(event.refs).dump();

  PreparedStatement stmt(db_->connection(), R"(
    INSERT INTO audit_events
      (event_id, trace_id, event_type, payload, created_at, refs_json, idx,
       previous_hash, event_hash)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
  )");
  if (!stmt.is_valid()) {
    throw std::runtime_error("audit insert prepare failed: " + stmt.error());
  }

  sqlite3_bind_text(stmt.get(), 1, event.event_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, event.trace_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, event.event_type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 4, event.payload.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 5, event.created_at.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 6, refs.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt.get(), 7, head.next_idx);
  sqlite3_bind_text(stmt.get(), 8, head.last_hash.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 9, event_hash.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw std::runtime_error("audit insert failed for " + event.event_id + ": " +
                             sqlite3_errmsg(db_->connection()));
  }

  // Head only advances once the row is durable.
  ++head.next_idx;
  head.last_hash = event_hash;
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  std::string sql =
      "SELECT event_id, trace_id, event_type, payload, created_at, refs_json,"
      "       previous_hash, event_hash FROM audit_events";
  sql += trace_id.empty() ? " ORDER BY rowid" : " WHERE trace_id = ? ORDER BY idx";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }
  if (!trace_id.empty()) {
    sqlite3_bind_text(stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);
  }

  std::vector<AuditEvent> out;
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
    out.push_back(std::move(event));
  }
  return out;
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

}  // namespace takoa::storage::sqlite
