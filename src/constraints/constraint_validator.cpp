#include "archcheck/constraints/constraint_validator.h"

#include "archcheck/core/text.h"

#include <utility>
#include <vector>

namespace archcheck::constraints {

Violation ConstraintValidator::make_violation(const registry::Constraint& constraint,
                                              const ConstraintContext& context,
                                              std::string message,
                                              std::optional<semantic::SourceLocation> location,
                                              std::string fix_hint) const {
  Violation violation;
  violation.code = std::string(error_code());
  violation.rule = constraint.rule;
  violation.value = registry::value_to_string(constraint.value);
  violation.severity = constraint.severity;
  if (location.has_value()) {
    violation.line = location->line;
    violation.column = location->column;
  }
  violation.message = std::move(message);
  violation.why = constraint.why;
  violation.fix_hint = std::move(fix_hint);
  violation.source = constraint.source.empty() ? context.constraint_source : constraint.source;
  violation.did_you_mean = did_you_mean_for(constraint);
  violation.alternatives = constraint.alternatives;
  return violation;
}

std::optional<DidYouMean> did_you_mean_for(const registry::Constraint& constraint) {
  if (!constraint.alternatives.empty()) {
    const auto& first = constraint.alternatives.front();
    return DidYouMean{first.module, first.export_name,
                      first.description.empty() ? "Use the canonical implementation"
                                                : first.description,
                      first.example};
  }
  if (constraint.alternative.has_value()) {
    return DidYouMean{*constraint.alternative, "",
                      constraint.why.empty() ? "Use the approved alternative instead"
                                             : constraint.why,
                      ""};
  }
  return std::nullopt;
}

std::string alternatives_hint(const registry::Constraint& constraint) {
  if (!constraint.alternatives.empty()) {
    std::vector<std::string> modules;
    modules.reserve(constraint.alternatives.size());
    for (const auto& alternative : constraint.alternatives) {
      modules.push_back(alternative.module);
    }
    if (modules.size() == 1) {
      return "Use the approved alternative: " + modules.front();
    }
    return "Use an approved alternative: " + core::join(modules, ", ");
  }
  if (constraint.alternative.has_value()) {
    return "Use the approved alternative: " + *constraint.alternative;
  }
  return {};
}

std::string replace_with_hint(const registry::Constraint& constraint) {
  if (!constraint.alternatives.empty()) {
    const auto& first = constraint.alternatives.front();
    if (!first.export_name.empty()) {
      return "Replace with '" + first.module + "' (use " + first.export_name + ")";
    }
    return "Replace with '" + first.module + "'";
  }
  if (constraint.alternative.has_value()) {
    return "Replace with '" + *constraint.alternative + "'";
  }
  return {};
}

Suggestion replacement_suggestion(const registry::Constraint& constraint,
                                  const std::string& target, const bool wildcard_import) {
  if (!constraint.alternatives.empty()) {
    const auto& first = constraint.alternatives.front();
    if (!first.export_name.empty()) {
      return Suggestion{"replace", target, first.export_name,
                        "import { " + first.export_name + " } from '" + first.module + "';"};
    }
    Suggestion suggestion{"replace", target, first.module, std::nullopt};
    if (wildcard_import) {
      suggestion.import_statement = "import * from '" + first.module + "';";
    }
    return suggestion;
  }
  if (constraint.alternative.has_value()) {
    return Suggestion{"replace", target, *constraint.alternative, std::nullopt};
  }
  return Suggestion{"remove", target, "", std::nullopt};
}

std::string strip_generics(const std::string_view type_name) {
  const auto open = type_name.find('<');
  return core::trim(open == std::string_view::npos ? type_name : type_name.substr(0, open));
}

std::vector<const semantic::ClassInfo*> classes_under_check(const semantic::SemanticModel& model) {
  std::vector<const semantic::ClassInfo*> exported;
  for (const auto& cls : model.classes) {
    if (cls.is_exported) {
      exported.push_back(&cls);
    }
  }
  if (!exported.empty()) {
    return exported;
  }
  std::vector<const semantic::ClassInfo*> all;
  all.reserve(model.classes.size());
  for (const auto& cls : model.classes) {
    all.push_back(&cls);
  }
  return all;
}

}  // namespace archcheck::constraints
