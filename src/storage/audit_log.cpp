#include "archcheck/storage/audit_log.h"

#include "archcheck/storage/audit_chain.h"

namespace archcheck::storage {

core::Result<bool, std::string> InMemoryAuditLog::append(const AuditEvent& event) {
  if (event.trace_id.empty()) {
    return core::Result<bool, std::string>::err("Audit event has no trace_id");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = last_hash_.find(event.trace_id);
  const std::string prev = (it != last_hash_.end()) ? it->second : std::string(kGenesisHash);

  AuditEvent stored = event;
  stored.previous_hash = prev;
  stored.event_hash = compute_event_hash(event, prev);

  last_hash_[event.trace_id] = stored.event_hash;
  events_.push_back(std::move(stored));
  return core::Result<bool, std::string>::ok(true);
}

std::vector<AuditEvent> InMemoryAuditLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (trace_id.empty()) {
    return events_;
  }

  std::vector<AuditEvent> filtered;
  for (const auto& event : events_) {
    if (event.trace_id == trace_id) {
      filtered.push_back(event);
    }
  }
  return filtered;
}

std::vector<std::string> InMemoryAuditLog::list_trace_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(last_hash_.size());
  for (const auto& [k, _] : last_hash_) {
    ids.push_back(k);
  }
  return ids;
}

}  // namespace archcheck::storage
