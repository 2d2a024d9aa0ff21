#include "archcheck/constraints/rules/naming_pattern.h"

#include "archcheck/constraints/pattern_compiler.h"
#include "archcheck/core/text.h"

#include <regex>

namespace archcheck::constraints {

ConstraintResult NamingPatternValidator::validate(const registry::Constraint& constraint,
                                                  const ConstraintContext& context) const {
  const semantic::SourceLocation top{1, 1};

  std::shared_ptr<const std::regex> regex;
  std::string description;
  if (constraint.naming.has_value()) {
    auto compiled = compile_naming_regex(*constraint.naming);
    if (!compiled.has_value()) {
      return make_result({make_violation(
          constraint, context, "Invalid structured naming pattern: " + compiled.error().message,
          top, "Set at least one of case, prefix, suffix or extension")});
    }
    regex = compiled.value();
    description = describe_naming_pattern(*constraint.naming);
  } else {
    const std::string pattern = constraint.pattern.value_or(
        registry::value_to_string(constraint.value));
    auto compiled = compile_plain_pattern(pattern);
    if (!compiled.has_value()) {
      return make_result({make_violation(
          constraint, context, "Invalid naming pattern regex: " + compiled.error().message, top,
          "Fix the naming pattern in the architecture registry")});
    }
    regex = compiled.value();
    description = pattern;
  }

  if (std::regex_search(context.file_name, *regex)) {
    return {};
  }

  std::string fix_hint = "Rename the file to match the pattern: " + description;
  if (!constraint.examples.empty()) {
    fix_hint += " (e.g. " + core::join(constraint.examples, ", ") + ")";
  }
  auto violation = make_violation(
      constraint, context,
      "File name '" + context.file_name + "' does not match naming pattern " + description, top,
      std::move(fix_hint));
  violation.suggestion = Suggestion{"rename", context.file_name, "", std::nullopt};
  return make_result({std::move(violation)});
}

}  // namespace archcheck::constraints
