#include "archcheck/constraints/rules/must_extend.h"

#include <algorithm>

namespace archcheck::constraints {

ConstraintResult MustExtendValidator::validate(const registry::Constraint& constraint,
                                               const ConstraintContext& context) const {
  const std::string required = strip_generics(registry::value_to_string(constraint.value));
  const std::string fix_hint = "Add 'extends " + required + "' to the class declaration";

  std::vector<Violation> violations;
  for (const auto* cls : classes_under_check(context.parsed_file)) {
    if (!cls->extends.has_value()) {
      violations.push_back(make_violation(
          constraint, context,
          "Class '" + cls->name + "' must extend '" + required + "' but has no base class",
          cls->location, fix_hint));
      continue;
    }

    const std::string actual = strip_generics(*cls->extends);
    if (actual == required) {
      continue;
    }
    const bool in_chain =
        std::any_of(cls->inheritance_chain.begin(), cls->inheritance_chain.end(),
                    [&](const std::string& ancestor) { return strip_generics(ancestor) == required; });
    if (in_chain) {
      continue;
    }
    violations.push_back(make_violation(
        constraint, context,
        "Class '" + cls->name + "' must extend '" + required + "', found '" + actual + "'",
        cls->location, fix_hint));
  }
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
