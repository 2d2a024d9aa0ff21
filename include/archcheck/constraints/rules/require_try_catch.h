#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E015: calls matching the patterns sit inside a try block.
class RequireTryCatchValidator final : public ConstraintValidator {
 public:
  RequireTryCatchValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "require_try_catch"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kRequireTryCatch; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
