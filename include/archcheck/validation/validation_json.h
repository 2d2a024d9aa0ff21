#pragma once

#include "archcheck/constraints/violation.h"
#include "archcheck/resolution/flattened_architecture.h"
#include "archcheck/validation/validation_result.h"

#include <nlohmann/json.hpp>

namespace archcheck::validation {

// Deterministic JSON for presentation layers. Keys are sorted (nlohmann::json's std::map
// default). Violation keys are the stable wire contract:
//   code, rule, value, severity, line, column, message, why, fixHint, source,
//   suggestion?, didYouMean?, alternatives?
// line and column are null when unknown; optional members are omitted when absent.
[[nodiscard]] nlohmann::json violation_to_json(const constraints::Violation& violation);

// Inverse of violation_to_json. Throws nlohmann::json::exception on missing required fields or
// type mismatches.
[[nodiscard]] constraints::Violation violation_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json conflict_to_json(const resolution::ConflictReport& conflict);

[[nodiscard]] nlohmann::json validation_result_to_json(const ValidationResult& result);

[[nodiscard]] nlohmann::json batch_result_to_json(const BatchValidationResult& batch);

}  // namespace archcheck::validation
