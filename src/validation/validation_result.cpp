#include "archcheck/validation/validation_result.h"

namespace archcheck::validation {

std::string_view to_string(const FileStatus status) noexcept {
  switch (status) {
    case FileStatus::kPass:
      return "pass";
    case FileStatus::kWarn:
      return "warn";
    case FileStatus::kFail:
      return "fail";
    case FileStatus::kUntagged:
      return "untagged";
    case FileStatus::kUnchecked:
      return "unchecked";
  }
  return "unchecked";
}

std::string_view to_string(const SkipReason reason) noexcept {
  switch (reason) {
    case SkipReason::kCapability:
      return "capability";
    case SkipReason::kCondition:
      return "condition";
    case SkipReason::kUnless:
      return "unless";
    case SkipReason::kAppliesWhen:
      return "applies_when";
    case SkipReason::kNoValidator:
      return "no_validator";
    case SkipReason::kProjectContextRequired:
      return "project_context_required";
    case SkipReason::kFiltered:
      return "filtered";
  }
  return "filtered";
}

BatchSummary summarize(const std::vector<ValidationResult>& results) {
  BatchSummary summary;
  summary.total = results.size();
  for (const auto& result : results) {
    switch (result.status) {
      case FileStatus::kPass:
        ++summary.passed;
        break;
      case FileStatus::kWarn:
        ++summary.warned;
        break;
      case FileStatus::kFail:
        ++summary.failed;
        break;
      case FileStatus::kUntagged:
        ++summary.untagged;
        break;
      case FileStatus::kUnchecked:
        ++summary.unchecked;
        break;
    }
    summary.total_errors += result.error_count();
    summary.total_warnings += result.warning_count();
    summary.active_overrides += result.active_overrides.size();
  }
  return summary;
}

}  // namespace archcheck::validation
