#include "archcheck/constraints/rules/forbid_call.h"

#include "archcheck/constraints/call_matcher.h"
#include "archcheck/constraints/intent_resolver.h"

#include <algorithm>

namespace archcheck::constraints {

ConstraintResult ForbidCallValidator::validate(const registry::Constraint& constraint,
                                               const ConstraintContext& context) const {
  const auto patterns = registry::value_to_list(constraint.value);
  const auto exempting = unless_intents(constraint.unless);

  std::vector<Violation> violations;
  for (const auto& call : context.parsed_file.function_calls) {
    for (const auto& pattern : patterns) {
      if (!call_matches(pattern, call)) {
        continue;
      }
      if (!exempting.empty()) {
        const auto intents = effective_intents_for_call(context, call);
        const bool exempt = std::any_of(exempting.begin(), exempting.end(),
                                        [&](const std::string& name) {
                                          return has_intent(intents, name);
                                        });
        if (exempt) {
          break;
        }
      }
      std::string message = "Call to '" + call.callee + "' is forbidden";
      if (pattern != call.callee) {
        message += " (matches '" + pattern + "')";
      }
      std::string fix_hint = replace_with_hint(constraint);
      if (fix_hint.empty()) {
        fix_hint = "Remove the call to '" + call.callee + "'";
      }
      auto violation = make_violation(constraint, context, std::move(message), call.location,
                                      std::move(fix_hint));
      violation.suggestion = replacement_suggestion(constraint, call.callee, true);
      violations.push_back(std::move(violation));
      break;
    }
  }
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
