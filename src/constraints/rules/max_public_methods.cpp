#include "archcheck/constraints/rules/max_public_methods.h"

#include <cmath>

namespace archcheck::constraints {

ConstraintResult MaxPublicMethodsValidator::validate(const registry::Constraint& constraint,
                                                     const ConstraintContext& context) const {
  const auto limit = registry::value_to_number(constraint.value);
  if (!limit.has_value()) {
    return make_result({make_violation(constraint, context,
                                       "max_public_methods requires a numeric value, got '" +
                                           registry::value_to_string(constraint.value) + "'",
                                       std::nullopt, "Set the constraint value to a number")});
  }
  const int maximum = static_cast<int>(std::floor(*limit));

  int count = 0;
  const semantic::ClassInfo* first = nullptr;
  for (const auto& cls : context.parsed_file.classes) {
    for (const auto& method : cls.methods) {
      if (method.visibility == semantic::Visibility::kPublic && method.name != "constructor") {
        ++count;
        if (first == nullptr) {
          first = &cls;
        }
      }
    }
  }
  if (count <= maximum) {
    return {};
  }

  const std::string limit_text = std::to_string(maximum);
  return make_result({make_violation(
      constraint, context,
      "File has " + std::to_string(count) + " public methods; maximum is " + limit_text,
      first != nullptr ? std::optional<semantic::SourceLocation>(first->location) : std::nullopt,
      "Reduce the number of public methods to " + limit_text +
          " or fewer. Consider extracting methods to helper classes.")});
}

}  // namespace archcheck::constraints
