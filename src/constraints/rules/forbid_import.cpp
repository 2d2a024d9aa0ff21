#include "archcheck/constraints/rules/forbid_import.h"

#include "archcheck/core/text.h"

namespace archcheck::constraints {

namespace {

// "axios" matches "axios" and "axios/lib/core" but not "axios-retry".
bool module_matches(const std::string& specifier, const std::string& forbidden) {
  if (specifier == forbidden) {
    return true;
  }
  return specifier.size() > forbidden.size() &&
         specifier.compare(0, forbidden.size(), forbidden) == 0 &&
         specifier[forbidden.size()] == '/';
}

bool is_layer_module(const std::string& specifier) {
  const std::string lower = core::normalize_ascii_lower(specifier);
  return core::contains(lower, "infrastructure") || core::contains(lower, "platform") ||
         core::contains(lower, "adapter");
}

}  // namespace

ConstraintResult ForbidImportValidator::validate(const registry::Constraint& constraint,
                                                 const ConstraintContext& context) const {
  const auto forbidden = registry::value_to_list(constraint.value);
  const std::string& source =
      constraint.source.empty() ? context.constraint_source : constraint.source;
  const std::string alternatives = alternatives_hint(constraint);

  std::vector<Violation> violations;
  for (const auto& imp : context.parsed_file.imports) {
    for (const auto& module : forbidden) {
      if (!module_matches(imp.module_specifier, module)) {
        continue;
      }
      const std::string kind = imp.is_dynamic ? "Dynamic import" : "Import";
      std::string fix_hint = alternatives;
      if (fix_hint.empty()) {
        fix_hint = is_layer_module(imp.module_specifier)
                       ? "Depend on an interface and receive the implementation through "
                         "dependency injection"
                       : "Remove the import or use an approved alternative";
      }
      auto violation = make_violation(constraint, context,
                                      kind + " of '" + imp.module_specifier +
                                          "' is forbidden (constraint from " + source + ")",
                                      imp.location, std::move(fix_hint));
      violation.suggestion = replacement_suggestion(constraint, imp.module_specifier);
      violations.push_back(std::move(violation));
      break;
    }
  }
  return make_result(std::move(violations));
}

}  // namespace archcheck::constraints
