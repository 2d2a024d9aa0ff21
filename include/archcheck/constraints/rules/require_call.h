#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E017: at least one call matches each listed pattern (or any, with match: any).
class RequireCallValidator final : public ConstraintValidator {
 public:
  RequireCallValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "require_call"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kRequireCall; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
