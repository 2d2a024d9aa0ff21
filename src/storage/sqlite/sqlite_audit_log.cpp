#include "archcheck/storage/sqlite/sqlite_audit_log.h"

#include "archcheck/storage/audit_chain.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

namespace archcheck::storage::sqlite {

namespace {

std::string column_text(sqlite3_stmt* stmt, const int column) {
  const auto* raw = sqlite3_column_text(stmt, column);
  return raw != nullptr ? reinterpret_cast<const char*>(raw) : std::string{};  // NOLINT
}

}  // namespace

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::Result<bool, std::string> SqliteAuditLog::append(const AuditEvent& event) {
  if (event.trace_id.empty()) {
    return core::Result<bool, std::string>::err("Audit event has no trace_id");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const AppendState state = get_append_state(event.trace_id);

  const std::string event_hash = compute_event_hash(event, state.previous_hash);
  const std::string refs_json = nlohmann::json(event.refs).dump();

  const char* sql = R"(
    INSERT INTO audit_events
      (event_id, trace_id, event_type, payload, created_at, refs_json, idx,
       previous_hash, event_hash)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return core::Result<bool, std::string>::err("Failed to prepare audit insert: " + stmt.error());
  }

  sqlite3_bind_text(stmt.get(), 1, event.event_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, event.trace_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, event.event_type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 4, event.payload.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 5, event.created_at.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 6, refs_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt.get(), 7, state.idx);
  sqlite3_bind_text(stmt.get(), 8, state.previous_hash.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 9, event_hash.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    // The idx was reserved; drop it so the next append re-reads the table.
    trace_indices_.erase(event.trace_id);
    return core::Result<bool, std::string>::err(std::string("Failed to insert audit event: ") +
                                                sqlite3_errmsg(db_->connection()));
  }
  return core::Result<bool, std::string>::ok(true);
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  const char* sql =
      "SELECT event_id, trace_id, event_type, payload, created_at, refs_json,"
      "       previous_hash, event_hash"
      "  FROM audit_events WHERE (?1 = '' OR trace_id = ?1) ORDER BY trace_id, idx";

  std::lock_guard<std::mutex> lock(mutex_);
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }

  sqlite3_bind_text(stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<AuditEvent> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    AuditEvent event;
    event.event_id = column_text(stmt.get(), 0);
    event.trace_id = column_text(stmt.get(), 1);
    event.event_type = column_text(stmt.get(), 2);
    event.payload = column_text(stmt.get(), 3);
    event.created_at = column_text(stmt.get(), 4);

    const auto refs_json = nlohmann::json::parse(column_text(stmt.get(), 5), nullptr, false);
    if (refs_json.is_array()) {
      event.refs = refs_json.get<std::vector<std::string>>();
    }

    event.previous_hash = column_text(stmt.get(), 6);
    event.event_hash = column_text(stmt.get(), 7);

    result.push_back(std::move(event));
  }

  return result;
}

std::vector<std::string> SqliteAuditLog::list_trace_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  PreparedStatement stmt(db_->connection(),
                         "SELECT DISTINCT trace_id FROM audit_events ORDER BY trace_id");
  if (!stmt.is_valid()) {
    return {};
  }
  std::vector<std::string> ids;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    ids.push_back(column_text(stmt.get(), 0));
  }
  return ids;
}

SqliteAuditLog::AppendState SqliteAuditLog::get_append_state(const std::string& trace_id) {
  // ── idx ──────────────────────────────────────────────────────────────────
  int idx = 0;
  auto it = trace_indices_.find(trace_id);
  if (it != trace_indices_.end()) {
    idx = it->second;
    it->second = idx + 1;
  } else {
    // New trace for this instance: continue after whatever the table already holds.
    PreparedStatement idx_stmt(db_->connection(),
                               "SELECT MAX(idx) FROM audit_events WHERE trace_id = ?");
    int max_idx = -1;
    if (idx_stmt.is_valid()) {
      sqlite3_bind_text(idx_stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);
      if (sqlite3_step(idx_stmt.get()) == SQLITE_ROW &&
          sqlite3_column_type(idx_stmt.get(), 0) != SQLITE_NULL) {
        max_idx = sqlite3_column_int(idx_stmt.get(), 0);
      }
    }
    idx = max_idx + 1;
    trace_indices_[trace_id] = idx + 1;
  }

  // ── previous_hash ─────────────────────────────────────────────────────────
  std::string previous_hash = std::string(kGenesisHash);
  if (idx > 0) {
    PreparedStatement hash_stmt(
        db_->connection(),
        "SELECT event_hash FROM audit_events WHERE trace_id = ? ORDER BY idx DESC LIMIT 1");
    if (hash_stmt.is_valid()) {
      sqlite3_bind_text(hash_stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);
      if (sqlite3_step(hash_stmt.get()) == SQLITE_ROW) {
        previous_hash = column_text(hash_stmt.get(), 0);
      }
    }
  }

  return {idx, std::move(previous_hash)};
}

}  // namespace archcheck::storage::sqlite
