#include "archcheck/constraints/rules/implements.h"

#include <algorithm>

namespace archcheck::constraints {

ConstraintResult ImplementsValidator::validate(const registry::Constraint& constraint,
                                               const ConstraintContext& context) const {
  const std::string required = strip_generics(registry::value_to_string(constraint.value));

  std::vector<Violation> violations;
  for (const auto* cls : classes_under_check(context.parsed_file)) {
    const bool found =
        std::any_of(cls->implements.begin(), cls->implements.end(),
                    [&](const std::string& iface) { return strip_generics(iface) == required; });
    if (found) {
      continue;
    }
    violations.push_back(
        make_violation(constraint, context,
                       "Class '" + cls->name + "' must implement '" + required + "'",
                       cls->location, "Add 'implements " + required + "' to the class declaration"));
  }
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
