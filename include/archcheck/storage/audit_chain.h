#pragma once

#include "archcheck/storage/audit_event.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace archcheck::storage {

// previous_hash of the first event in each trace. 16 zero hex digits, the width of
// core::stable_hash64_hex.
inline constexpr std::string_view kGenesisHash = "0000000000000000";

// FNV-1a 64 over the event's stable JSON (hash fields excluded, keys sorted) concatenated
// with previous_hash. Pure.
[[nodiscard]] std::string compute_event_hash(const AuditEvent& event,
                                             const std::string& previous_hash);

struct AuditChainVerificationResult {
  bool valid{false};                  // NOLINT(readability-identifier-naming)
  std::size_t first_invalid_index{};  // NOLINT(readability-identifier-naming)
  std::string error;                  // NOLINT(readability-identifier-naming)
};

// Checks events (one trace, append order) form an intact chain from kGenesisHash.
//   valid == true,  first_invalid_index == events.size()  chain intact
//   valid == false, first_invalid_index == N              event N is corrupt or out of order
[[nodiscard]] AuditChainVerificationResult verify_audit_chain(
    const std::vector<AuditEvent>& events);

}  // namespace archcheck::storage
