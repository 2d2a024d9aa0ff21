#include "archcheck/constraints/rules/forbid_pattern.h"

#include "archcheck/constraints/intent_resolver.h"
#include "archcheck/constraints/pattern_compiler.h"
#include "archcheck/core/text.h"
#include "archcheck/semantic/comment_scanner.h"

#include <algorithm>

namespace archcheck::constraints {

namespace {

constexpr std::size_t kMaxSnippetLength = 60;

}  // namespace

// With a `pattern` field the value is a human description ("console.log statements");
// otherwise a string value is the pattern itself.
ConstraintResult ForbidPatternValidator::validate(const registry::Constraint& constraint,
                                                  const ConstraintContext& context) const {
  const auto* value_text = std::get_if<std::string>(&constraint.value);
  std::optional<std::string> pattern = constraint.pattern;
  if (!pattern.has_value() && value_text != nullptr && !value_text->empty()) {
    pattern = *value_text;
  }
  if (!pattern.has_value()) {
    return make_result({make_violation(constraint, context,
                                       "forbid_pattern constraint is missing 'pattern' field",
                                       std::nullopt, "Add a pattern to the constraint")});
  }

  auto compiled = compile_content_pattern(*pattern);
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

  const std::string description = value_text != nullptr ? *value_text : "the pattern";
  std::string fix_hint = replace_with_hint(constraint);
  if (fix_hint.empty()) {
    fix_hint = "Remove or refactor code matching: " + description;
  }
  const auto exempting = unless_intents(constraint.unless);

  std::vector<Violation> violations;
  for (const auto& match : find_matches(*compiled.value(), content)) {
    const int line = core::line_at_offset(content, match.offset);
    if (!exempting.empty()) {
      const auto intents = effective_intents_at(context, line);
      if (std::any_of(exempting.begin(), exempting.end(),
                      [&](const std::string& name) { return has_intent(intents, name); })) {
        continue;
      }
    }

    std::string snippet = core::trim(match.text);
    if (snippet.size() > kMaxSnippetLength) {
      snippet = snippet.substr(0, kMaxSnippetLength) + "...";
    }
    auto violation = make_violation(
        constraint, context, "Forbidden pattern found: '" + snippet + "'",
        semantic::SourceLocation{line, core::column_at_offset(content, match.offset)}, fix_hint);
    violation.suggestion =
        replacement_suggestion(constraint, value_text != nullptr ? *value_text : snippet);
    violations.push_back(std::move(violation));
  }
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
