#include "archcheck/constraints/rules/require_export.h"

#include "archcheck/core/glob.h"

#include <algorithm>

namespace archcheck::constraints {

ConstraintResult RequireExportValidator::validate(const registry::Constraint& constraint,
                                                  const ConstraintContext& context) const {
  const auto& exports = context.parsed_file.exports;

  std::vector<Violation> violations;
  for (const auto& required : registry::value_to_list(constraint.value)) {
    const bool found =
        std::any_of(exports.begin(), exports.end(), [&](const semantic::ExportInfo& e) {
          if (required.find('*') != std::string::npos) {
            return core::glob_match(required, e.name);
          }
          return e.name == required || (required == "default" && e.is_default);
        });
    if (found) {
      continue;
    }
    auto violation =
        make_violation(constraint, context, "Required export '" + required + "' not found",
                       std::nullopt, "Export '" + required + "' from this file");
    violation.suggestion = Suggestion{"add", required, "", std::nullopt};
    violations.push_back(std::move(violation));
  }
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
