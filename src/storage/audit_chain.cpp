#include "archcheck/storage/audit_chain.h"

#include "archcheck/core/hashing.h"

#include <nlohmann/json.hpp>

#include <string>

namespace archcheck::storage {

std::string compute_event_hash(const AuditEvent& event, const std::string& previous_hash) {
  // nlohmann::json objects are std::map backed, so dump() emits keys sorted.
  nlohmann::json j;
  j["created_at"] = event.created_at;
  j["event_id"] = event.event_id;
  j["event_type"] = event.event_type;
  j["payload"] = event.payload;
  j["refs"] = event.refs;
  j["trace_id"] = event.trace_id;

  return core::stable_hash64_hex(j.dump() + previous_hash);
}

AuditChainVerificationResult verify_audit_chain(const std::vector<AuditEvent>& events) {
  if (events.empty()) {
    return {true, 0, ""};
  }

  std::string expected_previous = std::string(kGenesisHash);

  for (std::size_t i = 0; i < events.size(); ++i) {
    const AuditEvent& ev = events[i];

    if (ev.previous_hash != expected_previous) {
      return {false, i, "previous_hash mismatch at index " + std::to_string(i)};
    }

    const std::string computed = compute_event_hash(ev, ev.previous_hash);
    if (ev.event_hash != computed) {
      return {false, i, "event_hash mismatch at index " + std::to_string(i)};
    }

    expected_previous = ev.event_hash;
  }

  return {true, events.size(), ""};
}

}  // namespace archcheck::storage
