#include "archcheck/constraints/rules/require_pattern.h"

#include "archcheck/constraints/pattern_compiler.h"
#include "archcheck/core/text.h"
#include "archcheck/semantic/comment_scanner.h"

namespace archcheck::constraints {

ConstraintResult RequirePatternValidator::validate(const registry::Constraint& constraint,
                                                   const ConstraintContext& context) const {
  const std::string pattern =
      constraint.pattern.value_or(registry::value_to_string(constraint.value));
  if (pattern.empty()) {
    return make_result({make_violation(constraint, context,
                                       "require_pattern constraint is missing 'pattern' field",
                                       std::nullopt, "Add a pattern to the constraint")});
  }

  auto compiled = compile_content_pattern(pattern);
  if (!compiled.has_value()) {
    return make_result({make_violation(constraint, context, compiled.error().message,
                                       std::nullopt, "Fix the pattern in the architecture registry")});
  }

  const auto& model = context.parsed_file;
  const std::string content =
      constraint.exclude_comments
          ? semantic::blank_comments(model.content,
                                     semantic::find_comments(model.content, model.extension))
          : model.content;
  if (search(*compiled.value(), content)) {
    return {};
  }

  std::string fix_hint = "Add code matching the pattern '" + pattern + "'";
  if (!constraint.examples.empty()) {
    fix_hint += " (e.g. " + core::join(constraint.examples, ", ") + ")";
  }
  return make_result({make_violation(constraint, context,
                                     "Required pattern '" + pattern + "' not found in file",
                                     std::nullopt, std::move(fix_hint))});
}

}  // namespace archcheck::constraints
