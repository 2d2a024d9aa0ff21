#include "archcheck/constraints/rules/max_file_lines.h"

#include "archcheck/core/text.h"

#include <cmath>

namespace archcheck::constraints {

ConstraintResult MaxFileLinesValidator::validate(const registry::Constraint& constraint,
                                                 const ConstraintContext& context) const {
  const auto limit = registry::value_to_number(constraint.value);
  if (!limit.has_value()) {
    return make_result({make_violation(constraint, context,
                                       "max_file_lines requires a numeric value, got '" +
                                           registry::value_to_string(constraint.value) + "'",
                                       std::nullopt, "Set the constraint value to a number")});
  }
  const int maximum = static_cast<int>(std::floor(*limit));

  const auto& model = context.parsed_file;
  const int lines = model.line_count > 0
                        ? model.line_count
                        : static_cast<int>(core::split_lines(model.content).size());
  if (lines <= maximum) {
    return {};
  }

  return make_result({make_violation(
      constraint, context,
      "File has " + std::to_string(lines) + " lines; maximum is " + std::to_string(maximum),
      semantic::SourceLocation{maximum + 1, 1},
      "Split the file into smaller modules of at most " + std::to_string(maximum) +
          " lines each")});
}

}  // namespace archcheck::constraints
