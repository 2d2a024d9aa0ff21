#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E018: the content pattern matches somewhere in the file.
class RequirePatternValidator final : public ConstraintValidator {
 public:
  RequirePatternValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "require_pattern"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kRequirePattern; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
