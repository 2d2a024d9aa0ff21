#pragma once

#include "archcheck/core/result.h"
#include "archcheck/registry/constraint.h"
#include "archcheck/tags/override_policy.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace archcheck::validation {

// What happens to a file without an @arch tag.
enum class UntaggedPolicy {
  kAllow,  // NOLINT(readability-identifier-naming)
  kWarn,   // NOLINT(readability-identifier-naming)
  kDeny,   // NOLINT(readability-identifier-naming)
};

// Reporting level for forbid_* constraints declared without a `why` (C001).
enum class MissingWhyBehavior {
  kIgnore,   // NOLINT(readability-identifier-naming)
  kWarning,  // NOLINT(readability-identifier-naming)
  kError,    // NOLINT(readability-identifier-naming)
};

// Upper bound for an auto-sized worker pool.
inline constexpr unsigned kMaxConcurrency = 16;

// ValidationConfig holds every knob of the validation engine.
// Every field has an explicit default; optional fields mean "not configured".
struct ValidationConfig {
  UntaggedPolicy untagged_policy{UntaggedPolicy::kAllow};        // NOLINT(readability-identifier-naming)
  MissingWhyBehavior missing_why{MissingWhyBehavior::kIgnore};  // NOLINT(readability-identifier-naming)
  tags::OverridePolicy override_policy{};                        // NOLINT(readability-identifier-naming)
  // 0 = unlimited.
  int max_overrides_per_file{0};  // NOLINT(readability-identifier-naming)
  // Warnings fail the file.
  bool strict{false};  // NOLINT(readability-identifier-naming)
  // Rules never evaluated.
  std::vector<std::string> skip_rules;  // NOLINT(readability-identifier-naming)
  // Only constraints with one of these severities are evaluated; empty = all.
  std::vector<registry::Severity> severities;  // NOLINT(readability-identifier-naming)
  // Declared intent vocabulary. When set, unknown @intent names are reported (I001).
  std::optional<std::vector<std::string>> known_intents;  // NOLINT(readability-identifier-naming)
  bool unknown_intent_is_error{false};                     // NOLINT(readability-identifier-naming)
  // Batch worker count; 0 = 75% of hardware threads, clamped to [1, kMaxConcurrency].
  unsigned concurrency{0};  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::string_view to_string(UntaggedPolicy policy) noexcept;
[[nodiscard]] std::string_view to_string(MissingWhyBehavior behavior) noexcept;

// Worker count for a batch of `files` files.
[[nodiscard]] unsigned effective_concurrency(const ValidationConfig& config, std::size_t files,
                                             unsigned hardware_threads);

// Missing keys keep their defaults. Unknown enum strings and wrongly typed values are
// errors.
[[nodiscard]] core::Result<ValidationConfig, std::string> validation_config_from_json(
    const nlohmann::json& j);

// Deterministic JSON (keys sorted by nlohmann::json's std::map default).
[[nodiscard]] nlohmann::json validation_config_to_json(const ValidationConfig& config);

}  // namespace archcheck::validation
