#include "archcheck/constraints/rules/require_decorator.h"

#include <algorithm>

namespace archcheck::constraints {

ConstraintResult RequireDecoratorValidator::validate(const registry::Constraint& constraint,
                                                     const ConstraintContext& context) const {
  std::string decorator = registry::value_to_string(constraint.value);
  if (!decorator.empty() && decorator.front() == '@') {
    decorator.erase(0, 1);
  }

  std::vector<Violation> violations;
  for (const auto* cls : classes_under_check(context.parsed_file)) {
    const bool found =
        std::any_of(cls->decorators.begin(), cls->decorators.end(),
                    [&](const semantic::DecoratorInfo& d) { return d.name == decorator; });
    if (found) {
      continue;
    }
    auto violation = make_violation(
        constraint, context,
        "Class '" + cls->name + "' is missing required decorator '@" + decorator + "'",
        cls->location, "Add the '@" + decorator + "' decorator to class '" + cls->name + "'");
    violation.suggestion = Suggestion{"add", cls->name, "@" + decorator, std::nullopt};
    violations.push_back(std::move(violation));
  }
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
