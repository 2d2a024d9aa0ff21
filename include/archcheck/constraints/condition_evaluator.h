#pragma once

#include "archcheck/constraints/constraint_context.h"
#include "archcheck/constraints/pattern_compiler.h"
#include "archcheck/core/result.h"
#include "archcheck/registry/constraint.h"
#include "archcheck/semantic/semantic_model.h"

#include <string>
#include <vector>

namespace archcheck::constraints {

struct ConditionOutcome {
  bool satisfied{true};
  std::string reason;
};

// `when` clause: every field that is set must hold. Decorator names may carry a leading '@';
// has_import accepts '*' globs and also matches named and default imports.
[[nodiscard]] ConditionOutcome evaluate_condition(const registry::ConstraintCondition& condition,
                                                  const semantic::SemanticModel& model,
                                                  const std::string& file_path);

// `unless` list: satisfied (constraint skipped) when any entry holds for the file.
//   "import:X"      file imports X
//   "decorator:@X"  a class, method or function carries @X
//   "@intent:X"     file-level intent X
//   "X"             shorthand for import:X
// Function-level intents are honored per call site by the rules that inspect calls.
[[nodiscard]] ConditionOutcome evaluate_unless(const std::vector<std::string>& unless,
                                               const ConstraintContext& context);

// `applies_when`: the constraint applies only if the pattern matches the file content.
// An invalid pattern is an error, never a silent skip.
[[nodiscard]] core::Result<bool, PatternError> evaluate_applies_when(const std::string& pattern,
                                                                     const std::string& content);

[[nodiscard]] bool file_has_import(const semantic::SemanticModel& model, const std::string& spec);
[[nodiscard]] bool file_has_decorator(const semantic::SemanticModel& model,
                                      const std::string& decorator);

}  // namespace archcheck::constraints
