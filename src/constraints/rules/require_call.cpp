#include "archcheck/constraints/rules/require_call.h"

#include "archcheck/constraints/call_matcher.h"

#include <algorithm>

namespace archcheck::constraints {

ConstraintResult RequireCallValidator::validate(const registry::Constraint& constraint,
                                                const ConstraintContext& context) const {
  const auto required = registry::value_to_list(constraint.value);
  const auto& calls = context.parsed_file.function_calls;
  const auto present = [&](const std::string& pattern) {
    return std::any_of(calls.begin(), calls.end(), [&](const semantic::FunctionCallInfo& call) {
      return call_matches(pattern, call);
    });
  };

  if (constraint.match == registry::MatchMode::kAny) {
    if (required.empty() || std::any_of(required.begin(), required.end(), present)) {
      return {};
    }
    std::string listed;
    for (const auto& r : required) {
      listed += (listed.empty() ? "'" : ", '") + r + "'";
    }
    return make_result({make_violation(constraint, context,
                                       "None of the required calls found: " + listed,
                                       std::nullopt, "Add a call to one of: " + listed)});
  }

  std::vector<Violation> violations;
  for (const auto& r : required) {
    if (present(r)) {
      continue;
    }
    auto violation = make_violation(constraint, context, "Required call '" + r + "' not found",
                                    std::nullopt, "Add a call to '" + r + "'");
    violation.suggestion = Suggestion{"add", r, "", std::nullopt};
    violations.push_back(std::move(violation));
  }
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
