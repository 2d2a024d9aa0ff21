#include "archcheck/constraints/rules/require_try_catch.h"

#include "archcheck/constraints/call_matcher.h"

#include <algorithm>

namespace archcheck::constraints {

ConstraintResult RequireTryCatchValidator::validate(const registry::Constraint& constraint,
                                                    const ConstraintContext& context) const {
  const auto patterns =
      constraint.around.empty() ? registry::value_to_list(constraint.value) : constraint.around;

  std::vector<Violation> violations;
  for (const auto& call : context.parsed_file.function_calls) {
    if (call.control_flow.in_try_block) {
      continue;
    }
    const bool guarded = std::any_of(patterns.begin(), patterns.end(),
                                     [&](const std::string& p) { return call_matches(p, call); });
    if (!guarded) {
      continue;
    }
    violations.push_back(make_violation(
        constraint, context, "Call to '" + call.callee + "' must be wrapped in try/catch",
        call.location, "Wrap the call to '" + call.callee + "' in a try/catch block"));
  }
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
