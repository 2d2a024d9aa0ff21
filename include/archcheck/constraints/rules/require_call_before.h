#pragma once

#include "archcheck/constraints/constraint_validator.h"
#include "archcheck/constraints/error_codes.h"

namespace archcheck::constraints {

// E020: each call matching `before` is preceded, in the same function, by a call
// matching one of the value patterns.
class RequireCallBeforeValidator final : public ConstraintValidator {
 public:
  RequireCallBeforeValidator() = default;

  [[nodiscard]] std::string_view rule() const noexcept override { return "require_call_before"; }
  [[nodiscard]] std::string_view error_code() const noexcept override { return codes::kRequireCallBefore; }

  [[nodiscard]] ConstraintResult validate(const registry::Constraint& constraint,
                                          const ConstraintContext& context) const override;
};

}  // namespace archcheck::constraints
