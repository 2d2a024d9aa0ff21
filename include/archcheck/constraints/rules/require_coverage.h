#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E023: every value discovered in the source files is handled in the target files.
class RequireCoverageValidator final : public ConstraintValidator {
 public:
  RequireCoverageValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "require_coverage"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kRequireCoverage; }
  [[nodiscard]] bool requires_project() const noexcept override { return true; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
