#include "archcheck/constraints/rules/require_one_of.h"

#include "archcheck/constraints/intent_resolver.h"
#include "archcheck/constraints/pattern_compiler.h"
#include "archcheck/core/text.h"
#include "archcheck/semantic/comment_scanner.h"

#include <algorithm>

namespace archcheck::constraints {

namespace {

constexpr std::string_view kIntentPrefix = "@intent:";

bool is_regex_alternative(const std::string& alternative) {
  return alternative.size() >= 2 && alternative.front() == '/' && alternative.rfind('/') > 0;
}

bool is_annotation(const std::string& alternative) {
  return alternative.size() > 1 && alternative.front() == '@';
}

bool annotation_in_comments(const semantic::SemanticModel& model, const std::string& annotation) {
  const auto spans = semantic::find_comments(model.content, model.extension);
  return std::any_of(spans.begin(), spans.end(), [&](const semantic::CommentSpan& span) {
    return core::icontains(
        std::string_view(model.content).substr(span.begin, span.end - span.begin), annotation);
  });
}

}  // namespace

ConstraintResult RequireOneOfValidator::validate(const registry::Constraint& constraint,
                                                 const ConstraintContext& context) const {
  const auto* list = std::get_if<std::vector<std::string>>(&constraint.value);
  if (list == nullptr || list->empty()) {
    return make_result({make_violation(constraint, context,
                                       "require_one_of requires an array of patterns",
                                       std::nullopt, "List the acceptable patterns as an array")});
  }
  const auto& alternatives = *list;
  const auto& model = context.parsed_file;

  std::vector<Violation> violations;
  bool found = false;
  for (const auto& alternative : alternatives) {
    if (alternative.rfind(kIntentPrefix, 0) == 0) {
      found = has_intent_anywhere(context, alternative.substr(kIntentPrefix.size()));
    } else if (is_annotation(alternative)) {
      found = annotation_in_comments(model, alternative);
    } else if (is_regex_alternative(alternative)) {
      auto compiled = compile_content_pattern(alternative);
      if (!compiled.has_value()) {
        violations.push_back(make_violation(constraint, context, compiled.error().message,
                                            std::nullopt,
                                            "Fix the pattern in the architecture registry"));
        continue;
      }
      found = search(*compiled.value(), model.content);
    } else {
      found = core::contains(model.content, alternative);
    }
    if (found) {
      // An alternative matched, but broken patterns are still reported.
      return make_result(std::move(violations));
    }
  }

  std::string listed;
  for (const auto& alternative : alternatives) {
    listed += (listed.empty() ? "'" : ", '") + alternative + "'";
  }
  const auto opt_out =
      std::find_if(alternatives.begin(), alternatives.end(), [](const std::string& alternative) {
        return is_annotation(alternative) && alternative.rfind(kIntentPrefix, 0) != 0;
      });

  std::string fix_hint = "Add one of: " + listed;
  Suggestion suggestion{"add", context.file_name, alternatives.front(), std::nullopt};
  if (opt_out != alternatives.end()) {
    fix_hint += ", or add the opt-out annotation '" + *opt_out + "' in a comment";
    suggestion.replacement = "// " + *opt_out;
  }
  auto violation = make_violation(
      constraint, context, "None of the required patterns found. Expected one of: " + listed,
      semantic::SourceLocation{1, 1}, std::move(fix_hint));
  violation.suggestion = std::move(suggestion);
  violations.push_back(std::move(violation));
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
