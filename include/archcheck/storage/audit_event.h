#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace archcheck::storage {

// Event types written by the validation engine.
namespace event_types {
inline constexpr std::string_view kArchitectureResolved = "ArchitectureResolved";
inline constexpr std::string_view kOverrideApplied = "OverrideApplied";
inline constexpr std::string_view kFileValidated = "FileValidated";
}  // namespace event_types

struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;  // JSON object text
  std::string created_at;
  std::vector<std::string> refs;  // file path, architecture id
  std::string previous_hash{};  // NOLINT(readability-identifier-naming)
  std::string event_hash{};     // NOLINT(readability-identifier-naming)
};

}  // namespace archcheck::storage
