#pragma once

#include "archcheck/constraints/violation.h"
#include "archcheck/resolution/flattened_architecture.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace archcheck::validation {

enum class FileStatus {
  kPass,       // NOLINT(readability-identifier-naming)
  kWarn,       // NOLINT(readability-identifier-naming)
  kFail,       // NOLINT(readability-identifier-naming)
  kUntagged,   // NOLINT(readability-identifier-naming)
  kUnchecked,  // NOLINT(readability-identifier-naming)  no adapter, adapter failure, cancelled
};

enum class SkipReason {
  kCapability,              // NOLINT(readability-identifier-naming)
  kCondition,               // NOLINT(readability-identifier-naming)
  kUnless,                  // NOLINT(readability-identifier-naming)
  kAppliesWhen,             // NOLINT(readability-identifier-naming)
  kNoValidator,             // NOLINT(readability-identifier-naming)
  kProjectContextRequired,  // NOLINT(readability-identifier-naming)
  kFiltered,                // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::string_view to_string(FileStatus status) noexcept;
[[nodiscard]] std::string_view to_string(SkipReason reason) noexcept;

// A valid @override that suppressed (or stood ready to suppress) a violation. Reported,
// never silent.
struct ActiveOverride {
  std::string rule;
  std::string value;
  std::string reason;
  std::optional<std::string> expires;
  std::optional<std::string> ticket;
  std::optional<std::string> approved_by;
  int line{0};
  std::vector<std::string> warnings;  // policy warnings, e.g. no expiry
  std::size_t suppressed{0};          // violations this override suppressed
};

struct SkippedConstraint {
  std::string rule;
  std::string value;
  std::string source;
  SkipReason reason{SkipReason::kCondition};
  std::string detail;
};

struct ValidationResult {
  std::string file;
  std::optional<std::string> arch_id;
  FileStatus status{FileStatus::kPass};
  bool passed{true};
  std::vector<std::string> inheritance_chain;
  std::vector<std::string> mixins_applied;
  std::vector<constraints::Violation> violations;  // error severity, plus warnings when strict
  std::vector<constraints::Violation> warnings;    // warning and info severity
  std::vector<ActiveOverride> active_overrides;
  std::vector<SkippedConstraint> skipped;
  std::vector<resolution::ConflictReport> conflicts;
  // Why the file could not be checked (kUnchecked only).
  std::optional<std::string> unchecked_reason;
  // Set when writing the audit trail failed; the verdict itself stands.
  std::optional<std::string> audit_error;

  [[nodiscard]] std::size_t error_count() const noexcept { return violations.size(); }
  [[nodiscard]] std::size_t warning_count() const noexcept { return warnings.size(); }
};

struct BatchSummary {
  std::size_t total{0};
  std::size_t passed{0};
  std::size_t failed{0};
  std::size_t warned{0};
  std::size_t untagged{0};
  std::size_t unchecked{0};
  std::size_t total_errors{0};
  std::size_t total_warnings{0};
  std::size_t active_overrides{0};
};

struct BatchValidationResult {
  std::vector<ValidationResult> results;  // input order
  BatchSummary summary;
  bool cancelled{false};
};

[[nodiscard]] BatchSummary summarize(const std::vector<ValidationResult>& results);

}  // namespace archcheck::validation
