#pragma once

#include "archcheck/core/result.h"
#include "archcheck/storage/audit_event.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace archcheck::storage {

// Append-only event sink. append() computes previous_hash/event_hash itself; callers leave
// both empty.
class IAuditLog {
 public:
  virtual ~IAuditLog() = default;

  [[nodiscard]] virtual core::Result<bool, std::string> append(const AuditEvent& event) = 0;
  // Events of one trace in append order; an empty trace_id returns every event.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
  // Distinct trace IDs stored in this log, sorted.
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
  InMemoryAuditLog() = default;

  [[nodiscard]] core::Result<bool, std::string> append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  mutable std::mutex mutex_;
  std::vector<AuditEvent> events_;
  // Per-trace last event_hash, used to chain new events.
  std::map<std::string, std::string> last_hash_;
};

}  // namespace archcheck::storage
