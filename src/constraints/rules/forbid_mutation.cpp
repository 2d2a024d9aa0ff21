#include "archcheck/constraints/rules/forbid_mutation.h"

#include "archcheck/constraints/call_matcher.h"
#include "archcheck/constraints/intent_resolver.h"

#include <algorithm>

namespace archcheck::constraints {

namespace {

bool mutation_matches(const semantic::MutationInfo& mutation, const std::string& pattern) {
  if (pattern.find('*') != std::string::npos) {
    return callee_matches(pattern, mutation.target);
  }
  if (mutation.target == pattern || mutation.root_object == pattern) {
    return true;
  }
  return mutation.target.size() > pattern.size() &&
         mutation.target.compare(0, pattern.size(), pattern) == 0 &&
         (mutation.target[pattern.size()] == '.' || mutation.target[pattern.size()] == '[');
}

std::string describe_operation(const semantic::MutationOperator op) {
  switch (op) {
    case semantic::MutationOperator::kDelete:
      return "Delete of";
    case semantic::MutationOperator::kIncrement:
    case semantic::MutationOperator::kDecrement:
      return "Update of";
    case semantic::MutationOperator::kCompoundAssign:
      return "Compound assignment to";
    case semantic::MutationOperator::kAssign:
      return "Assignment to";
  }
  return "Mutation of";
}

}  // namespace

ConstraintResult ForbidMutationValidator::validate(const registry::Constraint& constraint,
                                                   const ConstraintContext& context) const {
  const auto patterns = registry::value_to_list(constraint.value);
  const auto exempting = unless_intents(constraint.unless);

  std::vector<Violation> violations;
  for (const auto& mutation : context.parsed_file.mutations) {
    const auto hit = std::find_if(patterns.begin(), patterns.end(), [&](const std::string& p) {
      return mutation_matches(mutation, p);
    });
    if (hit == patterns.end()) {
      continue;
    }
    if (!exempting.empty()) {
      const auto intents = effective_intents_at(context, mutation.location.line);
      if (std::any_of(exempting.begin(), exempting.end(),
                      [&](const std::string& name) { return has_intent(intents, name); })) {
        continue;
      }
    }
    violations.push_back(make_violation(
        constraint, context,
        describe_operation(mutation.op) + " '" + mutation.target + "' is forbidden",
        mutation.location,
        "Avoid mutating '" + *hit + "'; pass state explicitly or return a new value"));
  }
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
