#pragma once

#include "archcheck/storage/audit_log.h"
#include "archcheck/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace archcheck::storage::sqlite {

// SqliteAuditLog implements IAuditLog with SQLite backend.
// Append order is kept in the idx column; each event chains to the previous event of its
// trace. The mutex serializes all connection use.
class SqliteAuditLog final : public IAuditLog {
 public:
  // db must already carry the schema (SqliteDb::ensure_schema).
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, std::string> append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  std::shared_ptr<SqliteDb> db_;

  mutable std::mutex mutex_;
  // Next idx per trace seen by this instance.
  std::map<std::string, int> trace_indices_;

  struct AppendState {
    int idx{0};
    std::string previous_hash{};
  };

  // Caller holds mutex_.
  AppendState get_append_state(const std::string& trace_id);
};

}  // namespace archcheck::storage::sqlite
