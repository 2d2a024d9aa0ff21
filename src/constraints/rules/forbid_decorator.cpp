#include "archcheck/constraints/rules/forbid_decorator.h"

namespace archcheck::constraints {

ConstraintResult ForbidDecoratorValidator::validate(const registry::Constraint& constraint,
                                                    const ConstraintContext& context) const {
  std::string decorator = registry::value_to_string(constraint.value);
  if (!decorator.empty() && decorator.front() == '@') {
    decorator.erase(0, 1);
  }
  const std::string display = "'@" + decorator + "'";
  const std::string fix_hint = "Remove the " + display + " decorator";

  std::vector<Violation> violations;
  const auto report = [&](const std::string& owner, const semantic::DecoratorInfo& found) {
    auto violation = make_violation(constraint, context,
                                    owner + " uses forbidden decorator " + display,
                                    found.location, fix_hint);
    violation.suggestion = Suggestion{"remove", "@" + decorator, "", std::nullopt};
    violations.push_back(std::move(violation));
  };

  for (const auto* cls : classes_under_check(context.parsed_file)) {
    for (const auto& d : cls->decorators) {
      if (d.name == decorator) {
        report("Class '" + cls->name + "'", d);
      }
    }
    for (const auto& method : cls->methods) {
      for (const auto& d : method.decorators) {
        if (d.name == decorator) {
          report("Method '" + cls->name + "." + method.name + "'", d);
        }
      }
    }
  }
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
