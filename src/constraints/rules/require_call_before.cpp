#include "archcheck/constraints/rules/require_call_before.h"

#include "archcheck/constraints/call_matcher.h"
#include "archcheck/core/text.h"

#include <algorithm>

namespace archcheck::constraints {

namespace {

bool precedes(const semantic::SourceLocation& a, const semantic::SourceLocation& b) {
  return a.line < b.line || (a.line == b.line && a.column < b.column);
}

}  // namespace

ConstraintResult RequireCallBeforeValidator::validate(const registry::Constraint& constraint,
                                                      const ConstraintContext& context) const {
  const auto prerequisites = registry::value_to_list(constraint.value);
  if (constraint.before.empty() || prerequisites.empty()) {
    return make_result({make_violation(
        constraint, context,
        "require_call_before needs prerequisite calls in 'value' and guarded calls in 'before'",
        std::nullopt, "Fix the constraint in the architecture registry")});
  }

  const auto& calls = context.parsed_file.function_calls;
  const std::string listed = core::join(prerequisites, "', '");

  std::vector<Violation> violations;
  for (const auto& call : calls) {
    const bool guarded =
        std::any_of(constraint.before.begin(), constraint.before.end(),
                    [&](const std::string& pattern) { return call_matches(pattern, call); });
    if (!guarded) {
      continue;
    }
    const bool satisfied =
        std::any_of(calls.begin(), calls.end(), [&](const semantic::FunctionCallInfo& earlier) {
          if (earlier.parent_function != call.parent_function ||
              !precedes(earlier.location, call.location)) {
            return false;
          }
          return std::any_of(prerequisites.begin(), prerequisites.end(),
                             [&](const std::string& p) { return call_matches(p, earlier); });
        });
    if (satisfied) {
      continue;
    }
    violations.push_back(make_violation(
        constraint, context,
        "Call to '" + call.callee + "' must be preceded by a call to '" + listed + "'",
        call.location, "Call '" + prerequisites.front() + "' before '" + call.callee + "'"));
  }
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
