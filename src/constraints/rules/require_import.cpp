#include "archcheck/constraints/rules/require_import.h"

#include <algorithm>

namespace archcheck::constraints {

namespace {

// Satisfied by a module specifier (or a subpath of it), a named import or a default import.
bool requirement_met(const semantic::SemanticModel& model, const std::string& required) {
  return std::any_of(model.imports.begin(), model.imports.end(),
                     [&](const semantic::ImportInfo& imp) {
                       const auto& spec = imp.module_specifier;
                       if (spec == required ||
                           (spec.size() > required.size() &&
                            spec.compare(0, required.size(), required) == 0 &&
                            spec[required.size()] == '/')) {
                         return true;
                       }
                       if (std::find(imp.named_imports.begin(), imp.named_imports.end(),
                                     required) != imp.named_imports.end()) {
                         return true;
                       }
                       return imp.default_import == required;
                     });
}

}  // namespace

ConstraintResult RequireImportValidator::validate(const registry::Constraint& constraint,
                                                  const ConstraintContext& context) const {
  const auto required = registry::value_to_list(constraint.value);
  const auto& model = context.parsed_file;
  const semantic::SourceLocation top{1, 1};

  if (constraint.match == registry::MatchMode::kAny) {
    if (required.empty() || std::any_of(required.begin(), required.end(),
                                        [&](const std::string& r) {
                                          return requirement_met(model, r);
                                        })) {
      return {};
    }
    std::string listed;
    for (const auto& r : required) {
      listed += (listed.empty() ? "'" : ", '") + r + "'";
    }
    auto violation =
        make_violation(constraint, context, "None of the required imports found: " + listed, top,
                       "Import at least one of: " + listed);
    violation.suggestion = Suggestion{"add", required.front(), "", std::nullopt};
    return make_result({std::move(violation)});
  }

  std::vector<Violation> violations;
  for (const auto& r : required) {
    if (requirement_met(model, r)) {
      continue;
    }
    auto violation = make_violation(constraint, context, "Required import '" + r + "' is missing",
                                    top, "Add an import of '" + r + "'");
    violation.suggestion = Suggestion{"add", r, "", std::nullopt};
    violations.push_back(std::move(violation));
  }
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
